#include "eqgen/compiler.hpp"
#include "eqgen/classify.hpp"
#include "eqgen/diagnostics_json.hpp"
#include "eqgen/emit_cpp.hpp"
#include "eqgen/runtime/equality.hpp"
#include <algorithm>
#include <exception>
#include <thread>

namespace eqgen {

static void fold_positions(rt::hash_builder& h, const node_ptr& n){
    if(!n){ h.add(0); return; }
    h.add(static_cast<uint64_t>(line(*n)));
    h.add(static_cast<uint64_t>(col(*n)));
    if(auto* xs = elements(n)){ for(auto &x : *xs) fold_positions(h, x); return; }
    if(auto* m = std::get_if<map>(&n->data)){
        for(auto &kv : m->entries){ fold_positions(h, kv.first); fold_positions(h, kv.second); }
    }
}

uint64_t fingerprint(const node_ptr& form){
    rt::hash_builder h(value_hash(form));
    fold_positions(h, form);
    return h.finish();
}

std::shared_ptr<const DeclarationOutput> ContractCache::find(uint64_t key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(key);
    if(it==entries_.end()){ ++misses_; return nullptr; }
    ++hits_;
    return it->second;
}

void ContractCache::store(uint64_t key, std::shared_ptr<const DeclarationOutput> out){
    std::lock_guard<std::mutex> lk(mu_);
    entries_[key] = std::move(out);
}

size_t ContractCache::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

void ContractCache::clear(){
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
    hits_ = 0; misses_ = 0;
}

std::string CompileResult::source() const {
    std::string out = emit_prelude();
    for(auto &d : declarations) out += d.generated;
    return out;
}

std::shared_ptr<const DeclarationOutput> Compiler::compile_one(const node_ptr& form){
    rt::hash_builder kb(fingerprint(form));
    kb.add(opts_.fix_hints ? 1 : 0);
    uint64_t key = kb.finish();
    if(opts_.cache){
        if(auto hit = cache_.find(key)){
            trace(opts_, "cache hit " + hit->name);
            return hit;
        }
    }
    auto out = std::make_shared<DeclarationOutput>();
    Reporter rep{&out->diagnostics, "", opts_.fix_hints};
    auto decl = classify_declaration(form, rep);
    out->name = rep.declaration;
    if(decl){
        if(auto* host = std::get_if<HostDecl>(&*decl)){
            auto r = ContractChecker(opts_.fix_hints).check(*host);
            merge_into(out->diagnostics, r);
            if(out->diagnostics.success && r.contract){
                out->generated = emit_equality(*r.contract);
                out->contract = std::move(r.contract);
            }
        } else if(auto* en = std::get_if<EnumDecl>(&*decl)){
            auto r = EnumerationChecker(opts_.fix_hints).check(*en);
            merge_into(out->diagnostics, r);
            if(out->diagnostics.success && r.table){
                out->generated = emit_enumeration(*r.table);
                out->table = std::move(r.table);
            }
        }
    }
    trace(opts_, "checked " + (out->name.empty() ? std::string("<unnamed>") : out->name) + ": " +
                 std::to_string(out->diagnostics.errors.size()) + " errors, " +
                 std::to_string(out->diagnostics.warnings.size()) + " warnings");
    if(opts_.cache) cache_.store(key, out);
    return out;
}

CompileResult Compiler::compile(const node_ptr& module){
    CompileResult res;
    Reporter rep{&res, "", opts_.fix_hints};
    auto forms = module_forms(module, rep);
    std::vector<std::shared_ptr<const DeclarationOutput>> outs(forms.size());
    size_t jobs = std::min<size_t>(std::max(1u, opts_.jobs), forms.size());
    trace(opts_, "compiling " + std::to_string(forms.size()) + " declarations on " + std::to_string(std::max<size_t>(jobs,1)) + " worker(s)");
    if(jobs<=1){
        for(size_t i=0;i<forms.size(); ++i) outs[i] = compile_one(forms[i]);
    } else {
        std::atomic<size_t> next{0};
        std::mutex failMu; std::exception_ptr failure;
        std::vector<std::thread> workers;
        for(size_t w=0; w<jobs; ++w){
            workers.emplace_back([&]{
                for(;;){
                    size_t i = next++;
                    if(i>=forms.size()) return;
                    try { outs[i] = compile_one(forms[i]); }
                    catch(...){
                        std::lock_guard<std::mutex> lk(failMu);
                        if(!failure) failure = std::current_exception();
                        return;
                    }
                }
            });
        }
        for(auto &t : workers) t.join();
        if(failure) std::rethrow_exception(failure);
    }
    std::unordered_map<std::string,size_t> seen;
    for(size_t i=0;i<outs.size(); ++i){
        DeclarationOutput d = *outs[i];
        if(!d.name.empty()){
            auto it = seen.find(d.name);
            if(it!=seen.end()){
                Reporter dup{&d.diagnostics, d.name, opts_.fix_hints};
                auto &e = dup.emit(codes::MalformedDeclaration, "duplicate declaration '"+d.name+"'", "declaration names must be unique within a module",
                                   line(*forms[i]), col(*forms[i]));
                e.notes.push_back(Note{"first declared here", line(*forms[it->second]), col(*forms[it->second])});
                d.generated.clear(); d.contract.reset(); d.table.reset();
            } else seen.emplace(d.name, i);
        }
        merge_into(res, d.diagnostics);
        res.declarations.push_back(std::move(d));
    }
    maybe_print_json(res, opts_);
    return res;
}

CompileResult Compiler::compile_source(std::string_view text){
    return compile(parse(text));
}

} // namespace eqgen
