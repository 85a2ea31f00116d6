// EDN node model and reader for declaration modules (positions kept as metadata)
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <cctype>
#include <map>
#include <cstdint>

namespace eqgen
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line = -1, int col = -1)
            : std::runtime_error(line >= 0 ? msg + " (line " + std::to_string(line) + ":" + std::to_string(col) + ")" : msg), line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct set
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, set, map>;

    struct node
    {
        node_data data;
        std::map<std::string, int64_t> metadata; // line, col, end-line, end-col
    };

    // Structural equality and hash over EDN values (value.cpp). Metadata never participates.
    bool equal(const node_ptr &a, const node_ptr &b);
    uint64_t value_hash(const node_ptr &n);

    namespace detail
    {
        struct reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 1, col = 1;
            int last_line = 1, last_col = 1;
            explicit reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            char get()
            {
                if (eof())
                    return '\0';
                last_line = line;
                last_col = col;
                char c = d[p++];
                if (c == '\n') { ++line; col = 1; }
                else ++col;
                return c;
            }
            void skip_ws()
            {
                while (!eof())
                {
                    char c = peek();
                    if (c == ';')
                    {
                        while (!eof() && get() != '\n')
                            continue;
                        continue;
                    }
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',' || c == '\f' || c == '\v')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, line, col); }
        };
        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':'; }

        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline void attach_pos(node &n, int sl, int sc, int el, int ec)
        {
            n.metadata["line"] = sl;
            n.metadata["col"] = sc;
            n.metadata["end-line"] = el;
            n.metadata["end-col"] = ec;
        }

        inline node_ptr parse_value(reader &);

        inline node_ptr parse_collection(reader &r, char end, int sl, int sc, bool is_set = false)
        {
            std::vector<node_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                throw parse_error("unterminated collection", sl, sc);
            node_ptr out;
            if (is_set)
                out = make_node(set{std::move(elems)});
            else if (end == ')')
                out = make_node(list{std::move(elems)});
            else if (end == ']')
                out = make_node(vector_t{std::move(elems)});
            else
            {
                if (elems.size() % 2)
                    throw parse_error("map requires even number of forms", sl, sc);
                map m;
                for (size_t i = 0; i < elems.size(); i += 2)
                    m.entries.emplace_back(elems[i], elems[i + 1]);
                out = make_node(std::move(m));
            }
            attach_pos(*out, sl, sc, r.last_line, r.last_col);
            return out;
        }

        inline node_ptr parse_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get(); // opening quote
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"') { closed = true; break; }
                if (c != '\\') { out += c; continue; }
                if (r.eof())
                    break;
                char e = r.get();
                switch (e)
                {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                default: out += e; break;
                }
            }
            if (!closed)
                throw parse_error("unterminated string", sl, sc);
            auto n = make_node(std::move(out));
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_number(reader &r)
        {
            int sl = r.line, sc = r.col;
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            bool is_float = false;
            while (is_digit(r.peek()))
                num += r.get();
            if (r.peek() == '.')
            {
                is_float = true;
                num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            if (r.peek() == 'e' || r.peek() == 'E')
            {
                is_float = true;
                num += r.get();
                if (r.peek() == '+' || r.peek() == '-')
                    num += r.get();
                while (is_digit(r.peek()))
                    num += r.get();
            }
            node_ptr n;
            try
            {
                if (is_float)
                    n = make_node(std::stod(num));
                else
                    n = make_node((int64_t)std::stoll(num));
            }
            catch (const std::logic_error &)
            {
                throw parse_error("invalid number '" + num + "'", sl, sc);
            }
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_atom(reader &r)
        {
            int sl = r.line, sc = r.col;
            bool kw = false;
            if (r.peek() == ':')
            {
                kw = true;
                r.get();
            }
            std::string s;
            while (is_symbol_char(r.peek()))
                s += r.get();
            if (s.empty())
                throw parse_error("empty symbol", sl, sc);
            node_ptr n;
            if (kw)
                n = make_node(keyword{s});
            else if (s == "nil")
                n = make_node(std::monostate{});
            else if (s == "true")
                n = make_node(true);
            else if (s == "false")
                n = make_node(false);
            else
                n = make_node(symbol{s});
            attach_pos(*n, sl, sc, r.last_line, r.last_col);
            return n;
        }

        inline node_ptr parse_value(reader &r)
        {
            r.skip_ws();
            if (r.eof())
                r.fail("unexpected end of input");
            char c = r.peek();
            int sl = r.line, sc = r.col;
            switch (c)
            {
            case '"':
                return parse_string(r);
            case '(':
                r.get();
                return parse_collection(r, ')', sl, sc);
            case '[':
                r.get();
                return parse_collection(r, ']', sl, sc);
            case '{':
                r.get();
                return parse_collection(r, '}', sl, sc);
            case '#':
                r.get();
                if (r.get() != '{')
                    throw parse_error("only #{ } sets are supported after '#'", sl, sc);
                return parse_collection(r, '}', sl, sc, true);
            default:
                break;
            }
            if (is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p + 1])))
                return parse_number(r);
            if (c == ':' || is_symbol_start(c))
                return parse_atom(r);
            r.fail(std::string("unexpected character '") + c + "'");
        }
    } // namespace detail

    // Parse exactly one form; trailing content is an error.
    inline node_ptr parse(std::string_view input)
    {
        detail::reader r(input);
        auto v = detail::parse_value(r);
        r.skip_ws();
        if (!r.eof())
            r.fail("unexpected trailing characters");
        return v;
    }

    inline std::string to_string(const node_ptr &p);
    inline std::string to_string(const node &n)
    {
        struct V
        {
            std::string join(const std::vector<node_ptr> &xs, const char *open, char close) const
            {
                std::string out = open;
                for (size_t i = 0; i < xs.size(); ++i)
                {
                    if (i) out += ' ';
                    out += to_string(xs[i]);
                }
                return out + close;
            }
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                return oss.str();
            }
            std::string operator()(const std::string &s) const
            {
                std::string out = "\"";
                for (char c : s)
                {
                    if (c == '"' || c == '\\') out += '\\';
                    out += c;
                }
                return out + '"';
            }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string operator()(const list &l) const { return join(l.elems, "(", ')'); }
            std::string operator()(const vector_t &v) const { return join(v.elems, "[", ']'); }
            std::string operator()(const set &s) const { return join(s.elems, "#{", '}'); }
            std::string operator()(const map &m) const
            {
                std::string out = "{";
                for (size_t i = 0; i < m.entries.size(); ++i)
                {
                    if (i) out += ' ';
                    out += to_string(m.entries[i].first) + ' ' + to_string(m.entries[i].second);
                }
                return out + '}';
            }
        };
        return std::visit(V{}, n.data);
    }
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }

    inline bool is_nil(const node_ptr &n) { return !n || std::holds_alternative<std::monostate>(n->data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline const list *as_list(const node_ptr &n) { return n && is_list(*n) ? &std::get<list>(n->data) : nullptr; }
    inline const vector_t *as_vector(const node_ptr &n) { return n && std::holds_alternative<vector_t>(n->data) ? &std::get<vector_t>(n->data) : nullptr; }
    inline const keyword *as_keyword(const node_ptr &n) { return n && std::holds_alternative<keyword>(n->data) ? &std::get<keyword>(n->data) : nullptr; }

    // Element view over list/vector/set nodes; nullptr for anything else.
    inline const std::vector<node_ptr> *elements(const node_ptr &n)
    {
        if (!n) return nullptr;
        if (auto *l = std::get_if<list>(&n->data)) return &l->elems;
        if (auto *v = std::get_if<vector_t>(&n->data)) return &v->elems;
        if (auto *s = std::get_if<set>(&n->data)) return &s->elems;
        return nullptr;
    }

    // Symbol or string payload as a name; empty when the node is neither.
    inline std::string name_of(const node_ptr &n)
    {
        if (!n) return {};
        if (auto *s = std::get_if<symbol>(&n->data)) return s->name;
        if (auto *s = std::get_if<std::string>(&n->data)) return *s;
        return {};
    }
    inline std::string head_of(const node_ptr &n)
    {
        auto *l = as_list(n);
        if (!l || l->elems.empty() || !std::holds_alternative<symbol>(l->elems[0]->data)) return {};
        return std::get<symbol>(l->elems[0]->data).name;
    }

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        return it == n.metadata.end() ? def : (int)it->second;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_vec(std::vector<node_ptr> xs) { return detail::make_node(vector_t{std::move(xs)}); }
    inline node_ptr n_set(std::vector<node_ptr> xs) { return detail::make_node(set{std::move(xs)}); }

} // namespace eqgen
