#include "eqgen/classify.hpp"
#include <limits>
#include <unordered_map>

namespace eqgen {

static const char* const kScalars[] = {"bool","char","i8","i16","i32","i64","u8","u16","u32","u64","f32","f64"};
static const char* const kSequenceHeads[] = {"seq","vector","list","set","array","iterable"};

static void malformed(Reporter& rep, const node& at, std::string msg, std::string hint){
    rep.emit(codes::MalformedDeclaration, std::move(msg), std::move(hint), line(at), col(at));
}

static bool read_bool(const node_ptr& v, bool& out){
    if(!v || !std::holds_alternative<bool>(v->data)) return false;
    out = std::get<bool>(v->data); return true;
}

// Walk :key value pairs following the head symbol. A non-keyword stops the walk (ED001).
template<class F>
static void each_option(const std::vector<node_ptr>& l, Reporter& rep, const char* form, F&& f){
    for(size_t j=1;j<l.size(); ++j){
        auto* kw = as_keyword(l[j]);
        if(!kw){ malformed(rep,*l[j],std::string("expected keyword in (")+form+" ...)","write options as :key value pairs"); return; }
        if(j+1>=l.size()){ malformed(rep,*l[j],"option :"+kw->name+" has no value","supply a value after :"+kw->name); return; }
        f(kw->name, l[j+1]);
        ++j;
    }
}

std::vector<node_ptr> module_forms(const node_ptr& m, Reporter& rep){
    if(head_of(m)!="module"){
        rep.emit(codes::MalformedDeclaration,"expected (module ...)","start the file with (module <declaration>*)", m?line(*m):-1, m?col(*m):-1);
        return {};
    }
    auto &l = as_list(m)->elems;
    return std::vector<node_ptr>(l.begin()+1, l.end());
}

std::optional<TypeDesc> parse_type_desc(const node_ptr& n){
    if(!n) return std::nullopt;
    std::string sym = std::holds_alternative<symbol>(n->data) ? std::get<symbol>(n->data).name : std::string();
    if(!sym.empty()){
        TypeDesc t;
        for(auto s : kScalars) if(sym==s){ t.kind=TypeDesc::Kind::Scalar; t.name=sym; return t; }
        if(sym=="string"){ t.kind=TypeDesc::Kind::Text; t.name=sym; return t; }
        t.kind=TypeDesc::Kind::Opaque; t.name=sym; return t;
    }
    auto* l = as_list(n);
    if(!l || l->elems.size()!=2) return std::nullopt;
    std::string head = head_of(n);
    if(head=="ref"){
        std::string target = name_of(l->elems[1]);
        if(target.empty()) return std::nullopt;
        TypeDesc t; t.kind=TypeDesc::Kind::Opaque; t.name=target; return t;
    }
    for(auto s : kSequenceHeads){
        if(head!=s) continue;
        auto elem = parse_type_desc(l->elems[1]);
        if(!elem) return std::nullopt;
        TypeDesc t; t.kind=TypeDesc::Kind::Sequence; t.name=head; t.element=std::make_shared<TypeDesc>(std::move(*elem));
        return t;
    }
    return std::nullopt;
}

std::optional<Strategy> parse_strategy(const node_ptr& n, std::string& err){
    std::string head = head_of(n);
    if(head.empty()){ err="equality strategy must be a list form such as (include)"; return std::nullopt; }
    auto &l = as_list(n)->elems;
    int order=0; bool explicit_order=false; bool order_matters=true; bool deep=true;
    for(size_t j=1;j<l.size(); ++j){
        auto* kw = as_keyword(l[j]);
        if(!kw || j+1>=l.size()){ err="malformed options in ("+head+" ...)"; return std::nullopt; }
        auto val = l[++j];
        if(kw->name=="order"){
            if(!std::holds_alternative<int64_t>(val->data)){ err=":order expects an integer"; return std::nullopt; }
            int64_t v = std::get<int64_t>(val->data);
            if(v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()){ err=":order out of range"; return std::nullopt; }
            order = static_cast<int>(v); explicit_order=true;
        } else if(head=="sequence" && kw->name=="order-matters"){
            if(!read_bool(val,order_matters)){ err=":order-matters expects true or false"; return std::nullopt; }
        } else if(head=="sequence" && kw->name=="deep"){
            if(!read_bool(val,deep)){ err=":deep expects true or false"; return std::nullopt; }
        } else { err="unknown option :"+kw->name+" for "+head; return std::nullopt; }
    }
    if(head=="include") return Strategy{IncludeStrategy{order,explicit_order}};
    if(head=="ignore"){
        if(explicit_order){ err="(ignore) takes no options"; return std::nullopt; }
        return Strategy{IgnoreStrategy{}};
    }
    if(head=="sequence") return Strategy{SequenceStrategy{order,explicit_order,order_matters,deep}};
    if(head=="custom") return Strategy{CustomStrategy{order,explicit_order}};
    err="unknown equality strategy '"+head+"'";
    return std::nullopt;
}

static void read_strategies(const node_ptr& v, Member& m, Reporter& rep){
    std::vector<node_ptr> forms;
    if(as_list(v)) forms.push_back(v);
    else if(auto* vec = as_vector(v)) forms = vec->elems;
    else { malformed(rep,*v,"invalid :equality on '"+m.name+"'","use one strategy form or a vector of them"); return; }
    for(auto &f : forms){
        std::string err;
        auto s = parse_strategy(f, err);
        if(!s){ malformed(rep,*f,err,"strategies: (include) (ignore) (sequence) (custom)"); continue; }
        m.strategies.push_back(StrategyAnnotation{*s, line(*f), col(*f)});
    }
}

static std::optional<Member> read_member(const node_ptr& mf, size_t pos, Reporter& rep){
    std::string head = head_of(mf);
    Member m; m.position=pos; m.line=line(*mf); m.col=col(*mf);
    if(head=="field") m.kind=MemberKind::Field;
    else if(head=="property") m.kind=MemberKind::Property;
    else if(head=="method") m.kind=MemberKind::Method;
    else { malformed(rep,*mf,"member form must be (field ...), (property ...) or (method ...)","found "+to_string(mf)); return std::nullopt; }
    node_ptr typeNode, equalityNode;
    bool ok = true;
    each_option(as_list(mf)->elems, rep, head.c_str(), [&](const std::string& kw, const node_ptr& val){
        if(kw=="name") m.name = name_of(val);
        else if(kw=="type") typeNode = val;
        else if(kw=="equality") equalityNode = val;
        else if(kw=="readonly"){ if(!read_bool(val,m.readonly)){ malformed(rep,*val,":readonly expects true or false",""); ok=false; } }
        else if(kw=="computed"){ if(!read_bool(val,m.computed)){ malformed(rep,*val,":computed expects true or false",""); ok=false; } }
        else if(kw=="static"){ if(!read_bool(val,m.is_static)){ malformed(rep,*val,":static expects true or false",""); ok=false; } }
        else if(kw=="setter"){
            std::string s = name_of(val);
            if(s=="none") m.setter=Setter::None; else if(s=="init") m.setter=Setter::Init; else if(s=="set") m.setter=Setter::Set;
            else { malformed(rep,*val,"unknown :setter '"+to_string(val)+"'","use none, init or set"); ok=false; }
        }
    });
    if(m.name.empty()){ malformed(rep,*mf,head+" missing :name","expected ("+head+" :name x ...)"); return std::nullopt; }
    if(typeNode){
        auto t = parse_type_desc(typeNode);
        if(!t){ malformed(rep,*typeNode,"invalid :type form on '"+m.name+"'","use a scalar, string, (seq T) or a type name"); return std::nullopt; }
        m.type = std::move(*t);
    } else if(m.kind!=MemberKind::Method){
        malformed(rep,*mf,head+" '"+m.name+"' missing :type","add :type <type-form>"); return std::nullopt;
    }
    if(equalityNode) read_strategies(equalityNode, m, rep);
    if(!ok) return std::nullopt;
    return m;
}

static std::optional<HostDecl> read_class(const node_ptr& form, Reporter& rep){
    HostDecl d; d.line=line(*form); d.col=col(*form);
    node_ptr membersNode, functionsNode, attrsNode, baseNode;
    each_option(as_list(form)->elems, rep, "class", [&](const std::string& kw, const node_ptr& val){
        if(kw=="name") d.name = name_of(val);
        else if(kw=="namespace") d.ns = name_of(val);
        else if(kw=="partial"){ if(!read_bool(val,d.partial)) malformed(rep,*val,":partial expects true or false",""); }
        else if(kw=="attrs") attrsNode = val;
        else if(kw=="base") baseNode = val;
        else if(kw=="members") membersNode = val;
        else if(kw=="functions") functionsNode = val;
    });
    if(d.name.empty()){ malformed(rep,*form,"class missing :name","expected (class :name T ...)"); return std::nullopt; }
    rep.declaration = d.qualified_name();
    if(attrsNode){
        if(auto* v = as_vector(attrsNode)){
            for(auto &a : v->elems) if(name_of(a)=="value-object"){ d.contract_marker=true; d.marker_line=line(*a); d.marker_col=col(*a); }
        } else malformed(rep,*attrsNode,":attrs expects a vector","write :attrs [value-object]");
    }
    if(baseNode){
        std::string b = name_of(baseNode);
        if(b=="value-object") d.base = BaseShape::ValueObject;
        else if(head_of(baseNode)=="wrapper" && as_list(baseNode)->elems.size()==2){
            auto t = parse_type_desc(as_list(baseNode)->elems[1]);
            if(t){ d.base = BaseShape::Wrapper; d.wrapped = std::move(*t); }
            else malformed(rep,*baseNode,"invalid wrapped type in (wrapper ...)","write (wrapper <type>)");
        }
        else if(b.empty()) malformed(rep,*baseNode,"invalid :base form","use value-object, (wrapper <type>) or a base name");
    }
    if(membersNode){
        if(auto* v = as_vector(membersNode)){
            std::unordered_map<std::string,size_t> seen;
            for(auto &mf : v->elems){
                auto m = read_member(mf, d.members.size(), rep);
                if(!m) continue;
                auto it = seen.find(m->name);
                if(it!=seen.end()){
                    auto &e = rep.emit(codes::MalformedDeclaration,"duplicate member name '"+m->name+"'","member names must be unique within a declaration",m->line,m->col);
                    e.notes.push_back(Note{"first declared here", d.members[it->second].line, d.members[it->second].col});
                    continue;
                }
                seen[m->name] = d.members.size();
                d.members.push_back(std::move(*m));
            }
        } else malformed(rep,*membersNode,":members expects a vector","write :members [(field ...) ...]");
    }
    if(functionsNode){
        if(auto* v = as_vector(functionsNode)){
            for(auto &ff : v->elems){
                if(head_of(ff)!="fn"){ malformed(rep,*ff,"function form must be (fn :name F ...)",""); continue; }
                CompanionFn fn; fn.line=line(*ff); fn.col=col(*ff);
                each_option(as_list(ff)->elems, rep, "fn", [&](const std::string& kw, const node_ptr& val){
                    if(kw=="name") fn.name = name_of(val);
                    else if(kw=="static"){ if(!read_bool(val,fn.is_static)) malformed(rep,*val,":static expects true or false",""); }
                });
                if(fn.name.empty()){ malformed(rep,*ff,"fn missing :name",""); continue; }
                d.functions.push_back(std::move(fn));
            }
        } else malformed(rep,*functionsNode,":functions expects a vector","write :functions [(fn :name F) ...]");
    }
    return d;
}

static std::optional<EnumDecl> read_enumeration(const node_ptr& form, Reporter& rep){
    EnumDecl d; d.line=line(*form); d.col=col(*form);
    node_ptr constantsNode;
    each_option(as_list(form)->elems, rep, "enumeration", [&](const std::string& kw, const node_ptr& val){
        if(kw=="name") d.name = name_of(val);
        else if(kw=="namespace") d.ns = name_of(val);
        else if(kw=="partial"){ if(!read_bool(val,d.partial)) malformed(rep,*val,":partial expects true or false",""); }
        else if(kw=="constants") constantsNode = val;
    });
    if(d.name.empty()){ malformed(rep,*form,"enumeration missing :name","expected (enumeration :name E ...)"); return std::nullopt; }
    rep.declaration = d.qualified_name();
    if(!constantsNode) return d;
    auto* v = as_vector(constantsNode);
    if(!v){ malformed(rep,*constantsNode,":constants expects a vector","write :constants [(constant :name C :args [1 \"C\"]) ...]"); return d; }
    for(auto &cf : v->elems){
        if(head_of(cf)!="constant"){ malformed(rep,*cf,"enumeration entry must be (constant :name C :args [...])",""); continue; }
        EnumConstant c; c.position=d.constants.size(); c.line=line(*cf); c.col=col(*cf);
        node_ptr args;
        each_option(as_list(cf)->elems, rep, "constant", [&](const std::string& kw, const node_ptr& val){
            if(kw=="name") c.constant = name_of(val);
            else if(kw=="args") args = val;
        });
        if(c.constant.empty()){ malformed(rep,*cf,"constant missing :name",""); continue; }
        // Only (integer literal, string literal) pairs take part in static checks.
        if(auto* a = elements(args); a && a->size()==2){
            const auto &v0 = (*a)[0], &v1 = (*a)[1];
            if(v0 && v1 && std::holds_alternative<int64_t>(v0->data) && std::holds_alternative<std::string>(v1->data)){
                c.value = std::get<int64_t>(v0->data);
                c.name = std::get<std::string>(v1->data);
            }
        }
        d.constants.push_back(std::move(c));
    }
    return d;
}

std::optional<Declaration> classify_declaration(const node_ptr& form, Reporter& rep){
    std::string head = head_of(form);
    if(head=="class"){ if(auto d = read_class(form, rep)) return Declaration{std::move(*d)}; return std::nullopt; }
    if(head=="enumeration"){ if(auto d = read_enumeration(form, rep)) return Declaration{std::move(*d)}; return std::nullopt; }
    if(form) malformed(rep,*form,"unknown declaration form '"+(head.empty()?to_string(form):head)+"'","expected (class ...) or (enumeration ...)");
    else rep.emit(codes::MalformedDeclaration,"empty declaration form","",-1,-1);
    return std::nullopt;
}

} // namespace eqgen
