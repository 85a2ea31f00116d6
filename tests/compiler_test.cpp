#include <gtest/gtest.h>
#include "eqgen/compiler.hpp"
#include "test_env.hpp"

using namespace eqgen;

namespace {

const char* kModule = R"EDN(
(module
  (class :name Address :namespace app :partial true :attrs [value-object] :base value-object
    :members [ (field :name city :type string :readonly true :equality (include))
               (field :name lastName :type string :readonly true :equality (custom :order 1))
               (field :name note :type string :readonly true) ]
    :functions [ (fn :name Equals_LastName) (fn :name GetHashCode_LastName) ])
  (class :name Email :namespace app :partial true :base (wrapper string))
  (class :name Broken :namespace app :attrs [value-object] :base value-object
    :members [ (field :name x :type i32 :readonly true :equality (include)) ])
  (enumeration :name Color :namespace app :partial true
    :constants [ (constant :name Red :args [1 "Red"]) (constant :name Green :args [2 "Green"]) ])
  (class :name Plain :namespace app))
)EDN";

Options quiet_options(){
    Options o;
    o.jobs = 1;
    return o;
}

} // namespace

TEST(Compiler, CompilesMixedModule){
    Compiler c(quiet_options());
    auto r = c.compile_source(kModule);
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.declarations.size(), 5u);
    EXPECT_EQ(r.declarations[0].name, "app::Address");
    EXPECT_TRUE(r.declarations[0].contract);
    EXPECT_FALSE(r.declarations[0].generated.empty());
    EXPECT_EQ(count_code(r.declarations[0].diagnostics.warnings, codes::MissingStrategy), 1u);
    EXPECT_TRUE(r.declarations[1].contract && r.declarations[1].contract->wrapper);
    EXPECT_FALSE(r.declarations[2].contract);
    EXPECT_TRUE(r.declarations[2].generated.empty());
    EXPECT_EQ(count_code(r.errors, codes::NotExtensible), 1u);
    ASSERT_TRUE(r.declarations[3].table);
    EXPECT_EQ(r.declarations[3].table->get_all().size(), 2u);
    EXPECT_TRUE(r.declarations[4].generated.empty());
    EXPECT_TRUE(r.declarations[4].diagnostics.errors.empty());

    std::string src = r.source();
    EXPECT_EQ(src.rfind("// Generated by eqgenc. Do not edit.\n", 0), 0u);
    size_t address = src.find("// ---- app::Address ----");
    size_t email = src.find("// ---- app::Email (wrapper) ----");
    size_t color = src.find("// ---- app::Color (enumeration) ----");
    ASSERT_NE(address, std::string::npos);
    ASSERT_NE(email, std::string::npos);
    ASSERT_NE(color, std::string::npos);
    EXPECT_LT(address, email);
    EXPECT_LT(email, color);
    EXPECT_EQ(src.find("Broken"), std::string::npos);
}

TEST(Compiler, ParallelOutputMatchesSerial){
    Options serial = quiet_options();
    serial.cache = false;
    Options parallel = serial;
    parallel.jobs = 4;
    auto a = Compiler(serial).compile_source(kModule);
    auto b = Compiler(parallel).compile_source(kModule);
    EXPECT_EQ(a.source(), b.source());
    EXPECT_EQ(format_diagnostics(a), format_diagnostics(b));
    ASSERT_EQ(a.declarations.size(), b.declarations.size());
    for(size_t i=0;i<a.declarations.size(); ++i) EXPECT_EQ(a.declarations[i].name, b.declarations[i].name);
}

TEST(Compiler, CacheReusesUnchangedDeclarations){
    Compiler c(quiet_options());
    auto first = c.compile_source(kModule);
    EXPECT_EQ(c.cache().misses(), 5u);
    EXPECT_EQ(c.cache().hits(), 0u);
    EXPECT_EQ(c.cache().size(), 5u);
    auto second = c.compile_source(kModule);
    EXPECT_EQ(c.cache().hits(), 5u);
    EXPECT_EQ(first.source(), second.source());
    EXPECT_EQ(format_diagnostics(first), format_diagnostics(second));

    // Shifted positions change the diagnostics, so nothing is reused.
    c.compile_source(std::string("\n") + kModule);
    EXPECT_EQ(c.cache().hits(), 5u);
    EXPECT_EQ(c.cache().misses(), 10u);

    c.cache().clear();
    EXPECT_EQ(c.cache().size(), 0u);
    EXPECT_EQ(c.cache().hits(), 0u);
}

TEST(Compiler, CacheCanBeDisabled){
    Options o = quiet_options();
    o.cache = false;
    Compiler c(o);
    c.compile_source(kModule);
    c.compile_source(kModule);
    EXPECT_EQ(c.cache().size(), 0u);
    EXPECT_EQ(c.cache().hits(), 0u);
}

TEST(Compiler, FingerprintTracksContentAndPosition){
    EXPECT_EQ(fingerprint(parse("(class :name A)")), fingerprint(parse("(class :name A)")));
    EXPECT_NE(fingerprint(parse("(class :name A)")), fingerprint(parse("(class :name B)")));
    EXPECT_NE(fingerprint(parse("(class :name A)")), fingerprint(parse(" (class :name A)")));
}

TEST(Compiler, DuplicateDeclarationNames){
    auto r = Compiler(quiet_options()).compile_source(R"EDN((module
        (class :name Email :partial true :base (wrapper string))
        (class :name Email :partial true :base (wrapper i64))))EDN");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.declarations.size(), 2u);
    EXPECT_FALSE(r.declarations[0].generated.empty());
    EXPECT_TRUE(r.declarations[1].generated.empty());
    const Diagnostic* e = find_code(r.errors, codes::MalformedDeclaration);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->line, 3);
    ASSERT_EQ(e->notes.size(), 1u);
    EXPECT_EQ(e->notes[0].line, 2);
}

TEST(Compiler, RejectsNonModuleInput){
    auto r = Compiler(quiet_options()).compile_source("(class :name A)");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.declarations.empty());
    EXPECT_EQ(count_code(r.errors, codes::MalformedDeclaration), 1u);
    EXPECT_THROW(Compiler(quiet_options()).compile_source("(module (class"), parse_error);
}

TEST(Compiler, FixHintsFollowOptions){
    Options o = quiet_options();
    o.fix_hints = false;
    auto r = Compiler(o).compile_source(kModule);
    for(auto &d : r.errors) EXPECT_TRUE(d.fixes.empty());
    for(auto &d : r.warnings) EXPECT_TRUE(d.fixes.empty());
    auto with = Compiler(quiet_options()).compile_source(kModule);
    EXPECT_TRUE(has_fix(*find_code(with.warnings, codes::MissingStrategy), "add-include"));
}

TEST(Compiler, OptionsFromEnvironment){
    {
        ScopedEnv json("EQGEN_DIAG_JSON", "1");
        ScopedEnv tr("EQGEN_TRACE", "yes");
        ScopedEnv nc("EQGEN_NO_CACHE", "true");
        ScopedEnv fh("EQGEN_FIX_HINTS", "0");
        ScopedEnv jobs("EQGEN_JOBS", "8");
        Options o = detect_options();
        EXPECT_TRUE(o.diag_json);
        EXPECT_TRUE(o.trace);
        EXPECT_FALSE(o.cache);
        EXPECT_FALSE(o.fix_hints);
        EXPECT_EQ(o.jobs, 8u);
    }
    {
        ScopedEnv json("EQGEN_DIAG_JSON", "0");
        ScopedEnv tr("EQGEN_TRACE", nullptr);
        ScopedEnv nc("EQGEN_NO_CACHE", nullptr);
        ScopedEnv fh("EQGEN_FIX_HINTS", "1");
        ScopedEnv jobs("EQGEN_JOBS", "lots");
        Options o = detect_options();
        EXPECT_FALSE(o.diag_json);
        EXPECT_FALSE(o.trace);
        EXPECT_TRUE(o.cache);
        EXPECT_TRUE(o.fix_hints);
        EXPECT_EQ(o.jobs, 1u);
    }
    {
        ScopedEnv jobs("EQGEN_JOBS", "0");
        EXPECT_EQ(detect_options().jobs, 1u);
    }
}

TEST(Compiler, TraceAndJsonGoToStderr){
    Options o = quiet_options();
    o.trace = true;
    o.diag_json = true;
    testing::internal::CaptureStderr();
    Compiler(o).compile_source("(module (class :name Email :partial true :base (wrapper string)))");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[eqgen][trace] compiling 1 declarations on 1 worker(s)"), std::string::npos);
    EXPECT_NE(err.find("[eqgen][trace] checked Email: 0 errors, 0 warnings"), std::string::npos);
    EXPECT_NE(err.find("[eqgen][diag] {\"success\":true"), std::string::npos);
}
