// EDN value model: runtime values, raw specifications and the reader/printer for both
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
#include <cstddef>
#include <functional>

namespace hintc
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct set;
    struct map;
    struct tagged_value;
    struct native_fn;
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
    struct tagged_value
    {
        symbol tag;
        node_ptr inner;
    };
    // Host callable carried inside a value tree. Inside a specification it is a predicate.
    struct native_fn
    {
        std::string name;
        std::function<bool(const node_ptr &)> fn;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, set, map, tagged_value, native_fn>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Parse a single EDN form (entire input) into a node tree.
    node_ptr parse_one(std::string_view src);

    // Structural deep equality. Sets and maps compare unordered; native functions compare by name.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    // Structural hash consistent with equal(a, b, true).
    size_t hash_value(const node_ptr &n);

    struct node_hash
    {
        size_t operator()(const node_ptr &n) const { return hash_value(n); }
    };
    struct node_equal
    {
        bool operator()(const node_ptr &a, const node_ptr &b) const { return equal(a, b, true); }
    };

    namespace detail
    {
        class reader
        {
        public:
            explicit reader(std::string_view s) : d_(s) {}
            bool eof() const { return p_ >= d_.size(); }
            char peek() const { return eof() ? '\0' : d_[p_]; }
            int line() const { return line_; }
            int col() const { return col_; }
            int last_line() const { return last_line_; }
            int last_col() const { return last_col_; }
            char get()
            {
                if (eof())
                    return '\0';
                last_line_ = line_;
                last_col_ = col_;
                char c = d_[p_++];
                if (c == '\n')
                {
                    ++line_;
                    col_ = 1;
                }
                else
                    ++col_;
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
                    // commas are whitespace in EDN
                    if (c == ' ' || c == ',' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
            [[noreturn]] void fail(const std::string &msg) const
            {
                throw parse_error(msg + " at " + std::to_string(line_) + ":" + std::to_string(col_));
            }

        private:
            std::string_view d_;
            size_t p_ = 0;
            int line_ = 1, col_ = 1;
            int last_line_ = 1, last_col_ = 1;
        };

        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&' || c == '.'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '#' || c == ':' || c == '\''; }

        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline node_ptr make_int(int64_t v) { return make_node(node_data{v}); }
        inline void attach_pos(node &n, int sl, int sc, int el, int ec)
        {
            n.metadata["line"] = make_int(sl);
            n.metadata["col"] = make_int(sc);
            n.metadata["end-line"] = make_int(el);
            n.metadata["end-col"] = make_int(ec);
        }

        inline node_ptr parse_value(reader &);

        inline node_ptr parse_coll(reader &r, char end, int sl, int sc, bool as_set)
        {
            std::vector<node_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                r.fail(std::string("unterminated collection, expected '") + end + "'");
            node_ptr out;
            if (as_set)
                out = make_node(set{std::move(elems)});
            else if (end == ')')
                out = make_node(list{std::move(elems)});
            else if (end == ']')
                out = make_node(vector_t{std::move(elems)});
            else
            {
                if (elems.size() % 2)
                    r.fail("map requires an even number of forms");
                map m;
                for (size_t i = 0; i < elems.size(); i += 2)
                    m.entries.emplace_back(elems[i], elems[i + 1]);
                out = make_node(std::move(m));
            }
            attach_pos(*out, sl, sc, r.last_line(), r.last_col());
            return out;
        }

        inline node_ptr parse_string(reader &r)
        {
            int sl = r.line(), sc = r.col();
            r.get(); // opening quote
            std::string out;
            bool closed = false;
            while (!r.eof())
            {
                char c = r.get();
                if (c == '"')
                {
                    closed = true;
                    break;
                }
                if (c != '\\')
                {
                    out += c;
                    continue;
                }
                if (r.eof())
                    r.fail("bad escape");
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
                r.fail("unterminated string");
            auto n = make_node(std::move(out));
            attach_pos(*n, sl, sc, r.last_line(), r.last_col());
            return n;
        }

        inline node_ptr parse_number(reader &r)
        {
            int sl = r.line(), sc = r.col();
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
            catch (const std::exception &)
            {
                r.fail("invalid number '" + num + "'");
            }
            attach_pos(*n, sl, sc, r.last_line(), r.last_col());
            return n;
        }

        inline node_ptr parse_symbol_or_keyword(reader &r)
        {
            int sl = r.line(), sc = r.col();
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
                r.fail("empty symbol");
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
            attach_pos(*n, sl, sc, r.last_line(), r.last_col());
            return n;
        }

        inline node_ptr parse_dispatch(reader &r, int sl, int sc)
        {
            if (r.peek() == '{')
            {
                r.get();
                return parse_coll(r, '}', sl, sc, true);
            }
            if (r.peek() == '_')
            {
                // #_ discards the next form
                r.get();
                (void)parse_value(r);
                return parse_value(r);
            }
            std::string tag;
            while (is_symbol_char(r.peek()))
                tag += r.get();
            if (tag.empty())
                r.fail("tag expected after '#'");
            r.skip_ws();
            auto inner = parse_value(r);
            auto n = make_node(tagged_value{symbol{tag}, inner});
            attach_pos(*n, sl, sc, r.last_line(), r.last_col());
            return n;
        }

        inline node_ptr parse_value(reader &r)
        {
            r.skip_ws();
            if (r.eof())
                r.fail("unexpected end of input");
            char c = r.peek();
            int sl = r.line(), sc = r.col();
            switch (c)
            {
            case '"':
                return parse_string(r);
            case '(':
                r.get();
                return parse_coll(r, ')', sl, sc, false);
            case '[':
                r.get();
                return parse_coll(r, ']', sl, sc, false);
            case '{':
                r.get();
                return parse_coll(r, '}', sl, sc, false);
            case '#':
                r.get();
                return parse_dispatch(r, sl, sc);
            default:
                break;
            }
            if (is_digit(c))
                return parse_number(r);
            // a sign only starts a number when a digit follows ("-" and "+" alone are symbols)
            if ((c == '+' || c == '-'))
            {
                reader look = r;
                look.get();
                if (is_digit(look.peek()))
                    return parse_number(r);
            }
            if (c == ':' || is_symbol_start(c))
                return parse_symbol_or_keyword(r);
            r.fail(std::string("unexpected character '") + c + "'");
        }
    } // namespace detail

    inline node_ptr parse(std::string_view input)
    {
        detail::reader r(input);
        r.skip_ws();
        auto v = detail::parse_value(r);
        r.skip_ws();
        if (!r.eof())
            r.fail("unexpected trailing characters");
        return v;
    }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }
    inline std::string to_string(const node &n)
    {
        struct V
        {
            static std::string join(const std::vector<node_ptr> &xs, const char *open, char close)
            {
                std::string out = open;
                for (size_t i = 0; i < xs.size(); ++i)
                {
                    if (i)
                        out += ' ';
                    out += to_string(xs[i]);
                }
                out += close;
                return out;
            }
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                std::string s = oss.str();
                if (s.find_first_of(".eEn") == std::string::npos)
                    s += ".0";
                return s;
            }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
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
                    if (i)
                        out += ' ';
                    out += to_string(m.entries[i].first) + ' ' + to_string(m.entries[i].second);
                }
                out += '}';
                return out;
            }
            std::string operator()(const tagged_value &tv) const { return '#' + tv.tag.name + ' ' + to_string(tv.inner); }
            std::string operator()(const native_fn &f) const { return "#fn " + (f.name.empty() ? std::string("<anonymous>") : f.name); }
        };
        return std::visit(V{}, n.data);
    }

    // Short description of a value's kind for diagnostics ("int", "vector", "#point", ...).
    inline std::string kind_name(const node &n)
    {
        switch (n.data.index())
        {
        case 0: return "nil";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "string";
        case 5: return "keyword";
        case 6: return "symbol";
        case 7: return "list";
        case 8: return "vector";
        case 9: return "set";
        case 10: return "map";
        case 11: return '#' + std::get<tagged_value>(n.data).tag.name;
        case 12: return "fn";
        }
        return "<unknown>";
    }

    inline bool is_nil(const node &n) { return std::holds_alternative<std::monostate>(n.data); }
    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const tagged_value *as_tagged(const node &n) { return std::get_if<tagged_value>(&n.data); }
    inline const native_fn *as_native_fn(const node &n) { return std::get_if<native_fn>(&n.data); }
    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end())
            return def;
        if (auto v = std::get_if<int64_t>(&it->second->data))
            return (int)*v;
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    // ------ Factory helpers ------

    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    inline node_ptr n_tagged(std::string tag, node_ptr inner) { return detail::make_node(tagged_value{symbol{std::move(tag)}, std::move(inner)}); }
    inline node_ptr n_fn(std::string name, std::function<bool(const node_ptr &)> fn) { return detail::make_node(native_fn{std::move(name), std::move(fn)}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs = {}) { return detail::make_node(list{std::vector<node_ptr>(xs)}); }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs = {}) { return detail::make_node(vector_t{std::vector<node_ptr>(xs)}); }
    inline node_ptr node_set(std::initializer_list<node_ptr> xs = {}) { return detail::make_node(set{std::vector<node_ptr>(xs)}); }
    inline node_ptr node_map(std::initializer_list<std::pair<node_ptr, node_ptr>> xs = {}) { return detail::make_node(map{std::vector<std::pair<node_ptr, node_ptr>>(xs)}); }

    inline std::pair<node_ptr, node_ptr> kvp(node_ptr k, node_ptr v) { return {std::move(k), std::move(v)}; }

    // Append to a list/vector/set node (throws for other kinds)
    inline node_ptr &operator<<(node_ptr &c, const node_ptr &n)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        if (auto l = std::get_if<list>(&c->data))
            l->elems.push_back(n);
        else if (auto v = std::get_if<vector_t>(&c->data))
            v->elems.push_back(n);
        else if (auto s = std::get_if<set>(&c->data))
            s->elems.push_back(n);
        else
            throw std::invalid_argument("operator<<: container is not list/vector/set");
        return c;
    }
    inline node_ptr &operator<<(node_ptr &c, const std::pair<node_ptr, node_ptr> &kv)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        auto m = std::get_if<map>(&c->data);
        if (!m)
            throw std::invalid_argument("operator<<: container is not a map");
        m->entries.push_back(kv);
        return c;
    }

} // namespace hintc
