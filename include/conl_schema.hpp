// conl_schema.hpp - CONL - Schema model and resolver
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A schema is a CONL document:
//
//     root = <matcher>
//     definitions
//       <name>
//         docs = ...
//         scalar = <matcher>              one of these shapes, or none
//         one of                          to match only "no value"
//           = <matcher>
//         keys / required keys
//           <key matcher> = <matcher>
//         items = <matcher>
//         required items
//           = <matcher>
//
// A matcher is "<name>" (a reference to a definition) or a regular
// expression that must match the whole scalar. Either may be written as a
// map with "matches" and "docs" to attach documentation.

#ifndef CONL_SCHEMA_HPP
#define CONL_SCHEMA_HPP

#include "conl_document.hpp"

#include <map>
#include <memory>
#include <functional>

#include <re2/re2.h>

namespace conl
{
    enum class schema_error_kind
    {
        invalid_document,
        missing_root,
        unknown_field,
        duplicate_definition,
        invalid_matcher,
        invalid_pattern,
        conflicting_shapes,
        undefined_reference,
        circular_reference
    };

    using schema_error = error<schema_error_kind>;

    struct definition;

//========================================================================
// Matchers
//========================================================================

    enum class matcher_kind
    {
        pattern,
        reference
    };

    struct matcher
    {
        matcher_kind kind = matcher_kind::pattern;
        std::string  source;        // as authored
        std::string  docs;
        size_t       line = 0;

        std::shared_ptr<const re2::RE2> pattern;   // pattern matchers
        std::string                     reference; // reference matchers
        const definition*               resolved = nullptr;

        bool is_reference() const noexcept { return kind == matcher_kind::reference; }

        bool matches(std::string_view text) const
        {
            return pattern && re2::RE2::FullMatch(re2::StringPiece(text.data(), text.size()), *pattern);
        }

        // The literal strings a pattern accepts when it is a plain
        // alternation such as "red|green|blue"; nullopt otherwise.
        std::optional<std::vector<std::string>> literals() const;

        // How the matcher reads in "expected ..." and "missing ..." messages.
        std::vector<std::string> descriptions() const;
    };

//========================================================================
// Definitions
//========================================================================

    struct empty_shape {};

    struct scalar_shape
    {
        matcher match;
    };

    struct one_of_shape
    {
        std::vector<matcher> choices;
    };

    struct key_rule
    {
        matcher key;
        matcher value;
    };

    struct keys_shape
    {
        std::vector<key_rule> required;
        std::vector<key_rule> optional;
    };

    struct items_shape
    {
        std::vector<matcher>   required;
        std::optional<matcher> rest;
    };

    using definition_shape = std::variant<
        empty_shape,
        scalar_shape,
        one_of_shape,
        keys_shape,
        items_shape
    >;

    struct definition
    {
        std::string      name;
        std::string      docs;
        definition_shape shape;
        size_t           line = 0;
        bool             resolved = false;

        bool accepts_map() const noexcept  { return std::holds_alternative<keys_shape>(shape); }
        bool accepts_list() const noexcept { return std::holds_alternative<items_shape>(shape); }
    };

//========================================================================
// Schema
//========================================================================

    // Matchers point into the definition table, so a schema can be moved
    // but not copied.
    class schema
    {
    public:
        schema() = default;
        schema(schema&&) = default;
        schema& operator=(schema&&) = default;
        schema(schema const &) = delete;
        schema& operator=(schema const &) = delete;

        const matcher& root() const noexcept { return root_; }

        const definition* find(std::string_view name) const
        {
            auto it = definitions_.find(name);
            return it == definitions_.end() ? nullptr : &it->second;
        }

        size_t definition_count() const noexcept { return definitions_.size(); }

        // Binds references and rejects cycles that never consume document
        // structure. Calling it again on a resolved schema does nothing.
        std::vector<schema_error> resolve();

    private:
        void bind(matcher& m, std::vector<schema_error>& errors);
        bool check_cycles(definition& d, std::vector<std::string>& seen,
                          std::vector<schema_error>& errors);

        matcher root_;
        std::map<std::string, definition, std::less<>> definitions_;

        friend struct schema_compiler;
    };

    using schema_context = context<schema, schema_error>;

    // Builds a schema from an already parsed document and resolves it.
    schema_context compile_schema(const document& doc);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        constexpr std::string_view REGEX_META = "\\.+*?()[]{}^$|";

        // Patterns follow RE2 syntax with '.' matching newlines, so that
        // multiline scalars are matched whole.
        inline std::shared_ptr<const re2::RE2> compile_pattern(std::string_view text, std::string& error)
        {
            re2::RE2::Options options;
            options.set_dot_nl(true);
            options.set_log_errors(false);

            auto re = std::make_shared<const re2::RE2>(re2::StringPiece(text.data(), text.size()), options);
            if (!re->ok())
            {
                error = re->error();
                return nullptr;
            }
            return re;
        }

        template <typename F>
        void for_each_matcher(definition& d, F&& f)
        {
            std::visit([&](auto& s)
            {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, scalar_shape>)
                {
                    f(s.match);
                }
                else if constexpr (std::is_same_v<S, one_of_shape>)
                {
                    for (auto& m : s.choices) f(m);
                }
                else if constexpr (std::is_same_v<S, keys_shape>)
                {
                    for (auto& r : s.required) { f(r.key); f(r.value); }
                    for (auto& r : s.optional) { f(r.key); f(r.value); }
                }
                else if constexpr (std::is_same_v<S, items_shape>)
                {
                    for (auto& m : s.required) f(m);
                    if (s.rest) f(*s.rest);
                }
            }, d.shape);
        }
    }

//---------------------------------------------------------------------------

    inline std::optional<std::vector<std::string>> matcher::literals() const
    {
        if (kind != matcher_kind::pattern)
            return std::nullopt;

        std::vector<std::string> out;
        std::string_view rest = source;
        while (true)
        {
            size_t bar = rest.find('|');
            std::string_view alt = rest.substr(0, bar);

            if (alt.find_first_of(detail::REGEX_META) != std::string_view::npos)
                return std::nullopt;
            if (!alt.empty())
                out.emplace_back(alt);

            if (bar == std::string_view::npos)
                break;
            rest.remove_prefix(bar + 1);
        }

        if (out.empty())
            return std::nullopt;
        return out;
    }

    inline std::vector<std::string> matcher::descriptions() const
    {
        if (auto lits = literals())
            return *lits;
        return { source };
    }

//---------------------------------------------------------------------------

    inline void schema::bind(matcher& m, std::vector<schema_error>& errors)
    {
        if (!m.is_reference() || m.resolved)
            return;

        auto it = definitions_.find(m.reference);
        if (it == definitions_.end())
        {
            errors.push_back({
                schema_error_kind::undefined_reference,
                { m.line },
                "<" + m.reference + "> is not defined"
            });
            return;
        }
        m.resolved = &it->second;
    }

    inline bool schema::check_cycles(definition& d, std::vector<std::string>& seen,
                                     std::vector<schema_error>& errors)
    {
        if (d.resolved)
            return true;

        if (std::find(seen.begin(), seen.end(), d.name) != seen.end())
        {
            errors.push_back({
                schema_error_kind::circular_reference,
                { d.line },
                "<" + d.name + "> is defined in terms of itself"
            });
            return false;
        }

        // Only scalar and one-of references are followed: keys and items
        // descend into the document before recursing.
        std::vector<matcher*> direct;
        if (auto s = std::get_if<scalar_shape>(&d.shape))
            direct.push_back(&s->match);
        else if (auto o = std::get_if<one_of_shape>(&d.shape))
            for (auto& m : o->choices)
                direct.push_back(&m);

        seen.push_back(d.name);
        for (matcher* m : direct)
        {
            if (!m->is_reference())
                continue;

            auto it = definitions_.find(m->reference);
            if (it != definitions_.end() && !check_cycles(it->second, seen, errors))
                return false;
        }
        seen.pop_back();

        d.resolved = true;
        return true;
    }

    inline std::vector<schema_error> schema::resolve()
    {
        std::vector<schema_error> errors;

        bind(root_, errors);
        for (auto& [name, def] : definitions_)
            detail::for_each_matcher(def, [&](matcher& m) { bind(m, errors); });

        if (!errors.empty())
            return errors;

        for (auto& [name, def] : definitions_)
        {
            std::vector<std::string> seen;
            if (!check_cycles(def, seen, errors))
                break;
        }
        return errors;
    }

//========================================================================
// Schema compiler
//========================================================================

    struct schema_compiler
    {
        schema_context out;

        void compile(const document& doc);

    private:
        void fail(schema_error_kind kind, size_t line, std::string message)
        {
            out.errors.push_back({ kind, { line }, "invalid schema: " + std::move(message) });
        }

        bool check_key(const entry& e);

        matcher parse_matcher(std::string_view text, size_t line);
        matcher compile_matcher(const node& n, size_t line);
        std::vector<matcher>  compile_matcher_list(const node& n, size_t line);
        std::vector<key_rule> compile_key_rules(const node& n, size_t line);

        void compile_definitions(const node& n, size_t line);
        definition compile_definition(std::string name, const node& n, size_t line);
    };

//---------------------------------------------------------------------------

    inline bool schema_compiler::check_key(const entry& e)
    {
        if (!e.key.has_error())
            return true;

        fail(schema_error_kind::invalid_document, e.key.line, *e.key.error);
        return false;
    }

//---------------------------------------------------------------------------

    inline matcher schema_compiler::parse_matcher(std::string_view text, size_t line)
    {
        matcher m;
        m.source = std::string(text);
        m.line   = line;

        if (text.starts_with('<'))
        {
            m.kind = matcher_kind::reference;
            if (text.size() < 2 || !text.ends_with('>'))
            {
                fail(schema_error_kind::invalid_matcher, line, std::string(text) + ": missing closing >");
                return m;
            }
            m.reference = std::string(text.substr(1, text.size() - 2));
            return m;
        }

        m.kind = matcher_kind::pattern;
        std::string why;
        m.pattern = detail::compile_pattern(text, why);
        if (!m.pattern)
            fail(schema_error_kind::invalid_pattern, line, "invalid pattern " + std::string(text) + ": " + why);
        return m;
    }

//---------------------------------------------------------------------------

    inline matcher schema_compiler::compile_matcher(const node& n, size_t line)
    {
        if (n.is_scalar())
        {
            if (n.scalar->has_error())
            {
                fail(schema_error_kind::invalid_document, n.scalar->line, *n.scalar->error);
                return {};
            }
            return parse_matcher(n.scalar->content, line);
        }

        if (!n.is_map())
        {
            fail(schema_error_kind::invalid_matcher, line, "expected a matcher");
            return {};
        }

        std::optional<matcher> out;
        std::string docs;

        for (auto const & e : n.map)
        {
            if (!check_key(e))
                continue;

            if (e.key.content == "matches")
                out = compile_matcher(e.value, e.key.line);
            else if (e.key.content == "docs" && e.value.is_scalar())
                docs = e.value.scalar->content;
            else
                fail(schema_error_kind::unknown_field, e.key.line, "unknown matcher field " + e.key.content);
        }

        if (!out)
        {
            fail(schema_error_kind::invalid_matcher, line, "matcher has no \"matches\"");
            return {};
        }

        out->docs = std::move(docs);
        return std::move(*out);
    }

//---------------------------------------------------------------------------

    inline std::vector<matcher> schema_compiler::compile_matcher_list(const node& n, size_t line)
    {
        std::vector<matcher> out;
        if (n.empty())
            return out;

        if (!n.is_list())
        {
            fail(schema_error_kind::invalid_matcher, line, "expected a list of matchers");
            return out;
        }

        for (auto const & item : n.list)
        {
            if (check_key(item))
                out.push_back(compile_matcher(item.value, item.key.line));
        }
        return out;
    }

    inline std::vector<key_rule> schema_compiler::compile_key_rules(const node& n, size_t line)
    {
        std::vector<key_rule> out;
        if (n.empty())
            return out;

        if (!n.is_map())
        {
            fail(schema_error_kind::invalid_matcher, line, "expected a map of key matchers");
            return out;
        }

        for (auto const & e : n.map)
        {
            if (!check_key(e))
                continue;

            key_rule rule;
            rule.key   = parse_matcher(e.key.content, e.key.line);
            rule.value = compile_matcher(e.value, e.key.line);
            out.push_back(std::move(rule));
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline definition schema_compiler::compile_definition(std::string name, const node& n, size_t line)
    {
        definition d;
        d.name = std::move(name);
        d.line = line;

        if (n.empty())
            return d;

        if (!n.is_map())
        {
            fail(schema_error_kind::invalid_document, line, d.name + " must be a map");
            return d;
        }

        std::optional<matcher>               scalar;
        std::optional<std::vector<matcher>>  one_of;
        std::optional<std::vector<key_rule>> keys;
        std::optional<std::vector<key_rule>> required_keys;
        std::optional<matcher>               items;
        std::optional<std::vector<matcher>>  required_items;

        for (auto const & e : n.map)
        {
            if (!check_key(e))
                continue;

            std::string const & field = e.key.content;
            size_t at = e.key.line;

            if (field == "docs")
                d.docs = e.value.is_scalar() ? e.value.scalar->content : std::string();
            else if (field == "scalar")
                scalar = compile_matcher(e.value, at);
            else if (field == "one of")
                one_of = compile_matcher_list(e.value, at);
            else if (field == "keys")
                keys = compile_key_rules(e.value, at);
            else if (field == "required keys")
                required_keys = compile_key_rules(e.value, at);
            else if (field == "items")
                items = compile_matcher(e.value, at);
            else if (field == "required items")
                required_items = compile_matcher_list(e.value, at);
            else
                fail(schema_error_kind::unknown_field, at, "unknown field " + field + " in " + d.name);
        }

        int shapes = int(scalar.has_value())
                   + int(one_of.has_value())
                   + int(keys.has_value() || required_keys.has_value())
                   + int(items.has_value() || required_items.has_value());

        if (shapes > 1)
        {
            fail(schema_error_kind::conflicting_shapes, line,
                 d.name + " must have only one of scalar, one of, (required) keys, or (required) items");
            return d;
        }

        if (scalar)
        {
            d.shape = scalar_shape{ std::move(*scalar) };
        }
        else if (one_of)
        {
            d.shape = one_of_shape{ std::move(*one_of) };
        }
        else if (keys || required_keys)
        {
            keys_shape s;
            if (required_keys) s.required = std::move(*required_keys);
            if (keys)          s.optional = std::move(*keys);
            d.shape = std::move(s);
        }
        else if (items || required_items)
        {
            items_shape s;
            if (required_items) s.required = std::move(*required_items);
            s.rest = std::move(items);
            d.shape = std::move(s);
        }
        return d;
    }

//---------------------------------------------------------------------------

    inline void schema_compiler::compile_definitions(const node& n, size_t line)
    {
        if (n.empty())
            return;

        if (!n.is_map())
        {
            fail(schema_error_kind::invalid_document, line, "definitions must be a map");
            return;
        }

        for (auto const & e : n.map)
        {
            if (!check_key(e))
                continue;

            if (out.result.definitions_.contains(e.key.content))
            {
                fail(schema_error_kind::duplicate_definition, e.key.line,
                     "duplicate definition " + e.key.content);
                continue;
            }

            auto def = compile_definition(e.key.content, e.value, e.key.line);
            out.result.definitions_.emplace(e.key.content, std::move(def));
        }
    }

//---------------------------------------------------------------------------

    inline void schema_compiler::compile(const document& doc)
    {
        const node& root = doc.root();
        if (!root.empty() && !root.is_map())
        {
            fail(schema_error_kind::invalid_document, 1, "expected a map");
            return;
        }

        bool has_root = false;
        for (auto const & e : root.map)
        {
            if (!check_key(e))
                continue;

            if (e.key.content == "root")
            {
                has_root = true;
                out.result.root_ = compile_matcher(e.value, e.key.line);
            }
            else if (e.key.content == "definitions")
            {
                compile_definitions(e.value, e.key.line);
            }
            else
            {
                fail(schema_error_kind::unknown_field, e.key.line, "unknown field " + e.key.content);
            }
        }

        if (!has_root)
        {
            fail(schema_error_kind::missing_root, 1, "missing \"root\"");
            return;
        }

        // Resolution needs a structurally sound table.
        if (out.has_errors())
            return;

        auto errors = out.result.resolve();
        out.errors.insert(out.errors.end(), errors.begin(), errors.end());
    }

    inline schema_context compile_schema(const document& doc)
    {
        schema_compiler c;
        c.compile(doc);
        return std::move(c.out);
    }

} // namespace conl

#endif // CONL_SCHEMA_HPP
