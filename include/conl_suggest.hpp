// conl_suggest.hpp - CONL - Completion suggestions and documentation lookup
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Suggestions are read back from the attempt records of a validation run:
// whatever was tried at a line is what may be typed there. Only matchers
// whose accepted strings can be listed (literal alternations, possibly
// behind scalar or one-of references) contribute.

#ifndef CONL_SUGGEST_HPP
#define CONL_SUGGEST_HPP

#include "conl_validate.hpp"

namespace conl
{
    struct suggestion
    {
        std::string value;
        std::string docs;

        bool operator==(suggestion const &) const = default;
    };

    struct value_suggestions
    {
        std::vector<suggestion> values;
        bool map_allowed  = false;   // the value may be a nested map
        bool list_allowed = false;   // the value may be a list ("=" items)
    };

    std::vector<suggestion> suggest_keys(const document& doc, const attempt_map& attempts, size_t line);
    value_suggestions       suggest_values(const attempt_map& attempts, size_t line);

    std::string docs_for_key(const attempt_map& attempts, size_t line);
    std::string docs_for_value(const attempt_map& attempts, size_t line);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::string const & docs_of(const matcher& m)
        {
            if (m.docs.empty() && m.resolved)
                return m.resolved->docs;
            return m.docs;
        }

        // Schemas with cycles through scalar or one-of are rejected when
        // resolved, so the recursion terminates.
        inline void collect_literals(const matcher& m, std::string const & fallback_docs,
                                     std::vector<suggestion>& out)
        {
            if (!m.is_reference())
            {
                if (auto lits = m.literals())
                {
                    std::string const & docs = m.docs.empty() ? fallback_docs : m.docs;
                    for (auto& lit : *lits)
                        out.push_back({ std::move(lit), docs });
                }
                return;
            }

            if (!m.resolved)
                return;

            std::string const & docs = docs_of(m).empty() ? fallback_docs : docs_of(m);

            if (auto s = std::get_if<scalar_shape>(&m.resolved->shape))
            {
                collect_literals(s->match, docs, out);
            }
            else if (auto o = std::get_if<one_of_shape>(&m.resolved->shape))
            {
                for (auto const & choice : o->choices)
                    collect_literals(choice, docs, out);
            }
        }

        inline void sort_suggestions(std::vector<suggestion>& items)
        {
            std::stable_sort(items.begin(), items.end(), [](auto const & a, auto const & b)
            {
                return a.value < b.value;
            });
            items.erase(std::unique(items.begin(), items.end(), [](auto const & a, auto const & b)
            {
                return a.value == b.value;
            }), items.end());
        }

        inline const std::vector<attempt>* attempts_at(const attempt_map& attempts, position pos)
        {
            auto it = attempts.find(pos);
            return it == attempts.end() ? nullptr : &it->second;
        }

        inline std::string attempt_docs(attempt const & a)
        {
            if (!a.match->docs.empty())
                return a.match->docs;
            return a.def ? a.def->docs : std::string();
        }
    }

//---------------------------------------------------------------------------

    inline std::vector<suggestion> suggest_keys(const document& doc, const attempt_map& attempts, size_t line)
    {
        std::vector<suggestion> out;

        auto tried = detail::attempts_at(attempts, value_position(line));
        if (!tried)
            return out;

        for (auto const & a : *tried)
        {
            if (!a.def)
                continue;

            auto keys = std::get_if<keys_shape>(&a.def->shape);
            if (!keys)
                continue;

            for (auto const * rules : { &keys->required, &keys->optional })
            {
                for (auto const & rule : *rules)
                {
                    std::vector<suggestion> found;
                    detail::collect_literals(rule.key, {}, found);

                    std::string const & rule_docs = detail::docs_of(rule.value);
                    for (auto& s : found)
                    {
                        if (!rule_docs.empty())
                            s.docs = rule_docs;
                        out.push_back(std::move(s));
                    }
                }
            }
        }

        if (auto here = doc.value_at(line))
        {
            std::erase_if(out, [&](suggestion const & s)
            {
                return std::any_of(here->map.begin(), here->map.end(), [&](entry const & e)
                {
                    return !e.key.has_error() && e.key.content == s.value;
                });
            });
        }

        detail::sort_suggestions(out);
        return out;
    }

//---------------------------------------------------------------------------

    inline value_suggestions suggest_values(const attempt_map& attempts, size_t line)
    {
        value_suggestions out;

        auto tried = detail::attempts_at(attempts, value_position(line));
        if (!tried)
            return out;

        for (auto const & a : *tried)
        {
            if (a.def)
            {
                out.map_allowed  = out.map_allowed  || a.def->accepts_map();
                out.list_allowed = out.list_allowed || a.def->accepts_list();
            }

            // References are followed during validation, so the patterns
            // behind them have attempts of their own here.
            if (!a.match->is_reference())
                detail::collect_literals(*a.match, {}, out.values);
        }

        detail::sort_suggestions(out.values);
        return out;
    }

//---------------------------------------------------------------------------

    // The outermost successful matcher at a line documents its key; the
    // innermost documents the value itself.
    inline std::string docs_for_key(const attempt_map& attempts, size_t line)
    {
        auto tried = detail::attempts_at(attempts, value_position(line));
        if (!tried)
            return {};

        for (auto const & a : *tried)
        {
            if (!a.ok)
                continue;
            if (auto docs = detail::attempt_docs(a); !docs.empty())
                return docs;
        }
        return {};
    }

    inline std::string docs_for_value(const attempt_map& attempts, size_t line)
    {
        auto tried = detail::attempts_at(attempts, value_position(line));
        if (!tried)
            return {};

        for (auto it = tried->rbegin(); it != tried->rend(); ++it)
        {
            if (!it->ok)
                continue;
            if (auto docs = detail::attempt_docs(*it); !docs.empty())
                return docs;
        }
        return {};
    }

} // namespace conl

#endif // CONL_SUGGEST_HPP
