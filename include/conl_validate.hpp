// conl_validate.hpp - CONL - Validation engine
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef CONL_VALIDATE_HPP
#define CONL_VALIDATE_HPP

#include "conl_schema.hpp"

#include <compare>
#include <set>

namespace conl
{
//========================================================================
// Positions
//========================================================================

    enum class position_part
    {
        key,
        value
    };

    // Line 0 with part value is the document itself.
    struct position
    {
        size_t        line = 0;
        position_part part = position_part::value;

        bool is_root() const noexcept { return line == 0; }

        auto operator<=>(position const &) const = default;
    };

    inline position key_position(size_t line)   { return { line, position_part::key }; }
    inline position value_position(size_t line) { return { line, position_part::value }; }

//========================================================================
// Validation errors
//========================================================================

    struct decode_error          { std::string message; };
    struct schema_load_error     { std::string message; };
    struct expected_match        { std::vector<std::string> candidates; };
    struct missing_required_key  { std::vector<std::string> keys; };
    struct missing_required_item { std::string description; };
    struct unexpected            { std::string description; };
    struct duplicate_key         { std::string description; };

    using validation_problem = std::variant<
        decode_error,
        schema_load_error,
        expected_match,
        missing_required_key,
        missing_required_item,
        unexpected,
        duplicate_key
    >;

    struct validation_error
    {
        position           pos;
        validation_problem problem;

        // 1-based; document-level errors report on line 1.
        size_t line() const noexcept { return pos.line == 0 ? 1 : pos.line; }

        std::string message() const;

        // "<line>: <message>"
        std::string str() const { return std::to_string(line()) + ": " + message(); }

        // Byte range on the error's line to highlight in an editor.
        std::pair<size_t, size_t> range(std::string_view line_text) const;

        template <typename T>
        bool is() const noexcept { return std::holds_alternative<T>(problem); }
    };

//========================================================================
// Attempt records
//========================================================================

    // One matcher tried against the value at a position. Kept for
    // suggestions and documentation lookup after validation.
    struct attempt
    {
        const matcher*    match = nullptr;
        const definition* def   = nullptr;
        bool              ok    = false;
    };

    using attempt_map = std::map<position, std::vector<attempt>>;

    struct validation_outcome
    {
        std::vector<validation_error> errors;
        attempt_map                   attempts;
    };

    // Matches the document against the schema's root. Errors are rendered:
    // one per position, ordered by line with keys before values and the
    // document itself last.
    validation_outcome run_validation(const schema& s, const document& doc);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        struct line_split
        {
            size_t start_key;
            size_t end_key;
            size_t start_value;
            size_t end_value;
            size_t start_comment;
        };

        // A leading quoted literal is replaced by filler so that its '='
        // and ';' are not taken as separators.
        inline std::string mask_quoted(std::string_view s)
        {
            std::string out(s);
            if (s.starts_with('"'))
            {
                size_t close = closing_quote(s);
                if (close != std::string_view::npos)
                    std::fill_n(out.begin(), close + 1, 'a');
            }
            return out;
        }

        inline line_split split_line(std::string_view line)
        {
            std::string_view trimmed = trim_left(line);
            size_t start_key = line.size() - trimmed.size();
            std::string masked = mask_quoted(trimmed);

            size_t end_key     = line.size();
            size_t start_value = line.size();

            if (masked.starts_with('='))
            {
                end_key     = start_key + 1;
                start_value = end_key;
            }
            else if (size_t found = masked.find_first_of("=;"); found != std::string::npos)
            {
                end_key     = start_key + trim_right(std::string_view(masked).substr(0, found)).size();
                start_value = start_key + found + (masked[found] == '=' ? 1 : 0);
            }
            else
            {
                end_key = start_key + trim_right(masked).size();
            }

            std::string_view value_half = line.substr(start_value);
            trimmed = trim_left(value_half);
            start_value += value_half.size() - trimmed.size();
            masked = mask_quoted(trimmed);

            size_t end_value     = line.size();
            size_t start_comment = line.size();
            if (size_t found = masked.find(';'); found != std::string::npos)
            {
                end_value     = start_value + trim_right(std::string_view(masked).substr(0, found)).size();
                start_comment = start_value + found;
            }
            else
            {
                end_value = start_value + trim_right(masked).size();
            }

            return { start_key, end_key, start_value, end_value, start_comment };
        }

        // Lower is more important; only the most important kind present at
        // a position is reported.
        inline int priority(validation_problem const & p)
        {
            return std::visit([](auto const & problem)
            {
                using P = std::decay_t<decltype(problem)>;
                if constexpr (std::is_same_v<P, decode_error> || std::is_same_v<P, schema_load_error>)
                    return 0;
                else if constexpr (std::is_same_v<P, unexpected> || std::is_same_v<P, duplicate_key>)
                    return 1;
                else if constexpr (std::is_same_v<P, missing_required_key> || std::is_same_v<P, missing_required_item>)
                    return 2;
                else
                    return 3;
            }, p);
        }
    }

//---------------------------------------------------------------------------

    inline std::string validation_error::message() const
    {
        return std::visit([](auto const & p) -> std::string
        {
            using P = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<P, decode_error> || std::is_same_v<P, schema_load_error>)
                return p.message;
            else if constexpr (std::is_same_v<P, expected_match>)
                return "expected " + detail::join_with_or(p.candidates);
            else if constexpr (std::is_same_v<P, missing_required_key>)
                return "missing required key " + detail::join_with_or(p.keys);
            else if constexpr (std::is_same_v<P, missing_required_item>)
                return "missing required list item " + p.description;
            else if constexpr (std::is_same_v<P, unexpected>)
                return "unexpected " + p.description;
            else
                return "duplicate key " + p.description;
        }, problem);
    }

    inline std::pair<size_t, size_t> validation_error::range(std::string_view line_text) const
    {
        auto split = detail::split_line(line_text);

        if (pos.is_root())
            return { split.start_key, split.end_value };
        if (pos.part == position_part::key || split.start_value == split.end_value)
            return { split.start_key, split.end_key };
        return { split.start_value, split.end_value };
    }

//========================================================================
// Validator
//========================================================================

    namespace detail
    {
        using error_list = std::vector<validation_error>;

        inline size_t first_line(error_list const & errors)
        {
            size_t line = npos();
            for (auto const & e : errors)
                line = std::min(line, e.pos.line);
            return line;
        }

        // Picks between the failures of two candidate matches. The one that
        // got further into the document wins, then the more specific one;
        // otherwise both are kept and combined when rendered.
        inline error_list merge(error_list a, error_list b)
        {
            size_t la = first_line(a);
            size_t lb = first_line(b);
            if (la != lb)
                return la > lb ? std::move(a) : std::move(b);
            if (a.size() != b.size())
                return a.size() > b.size() ? std::move(a) : std::move(b);

            a.insert(a.end(), std::make_move_iterator(b.begin()), std::make_move_iterator(b.end()));
            return a;
        }

        inline void append(error_list& into, error_list more)
        {
            into.insert(into.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
        }

        class validator
        {
        public:
            explicit validator(attempt_map& attempts)
                : attempts_(attempts)
            {}

            error_list match(const matcher& m, const node& val, position pos);
            error_list check(const definition& d, const node& val, position pos);

        private:
            error_list check_keys(const keys_shape& s, const node& val, position pos);
            error_list check_items(const items_shape& s, const node& val, position pos);

            bool accepts_key(const matcher& m, const token& key);

            attempt_map& attempts_;
        };

//---------------------------------------------------------------------------

        inline error_list validator::match(const matcher& m, const node& val, position pos)
        {
            if (val.is_scalar() && val.scalar->has_error())
                return { { pos, decode_error{ *val.scalar->error } } };

            auto& here = attempts_[pos];
            size_t index = here.size();
            here.push_back(attempt{ &m, m.resolved, false });

            error_list errors;
            if (m.is_reference())
            {
                if (m.resolved)
                    errors = check(*m.resolved, val, pos);
                else
                    errors.push_back({ pos, expected_match{ { m.source } } });
            }
            else if (!val.is_scalar())
            {
                errors.push_back({ pos, expected_match{ { "any scalar" } } });
            }
            else if (!m.matches(val.scalar->content))
            {
                errors.push_back({ pos, expected_match{ m.descriptions() } });
            }

            attempts_[pos][index].ok = errors.empty();
            return errors;
        }

//---------------------------------------------------------------------------

        inline error_list validator::check(const definition& d, const node& val, position pos)
        {
            if (auto s = std::get_if<scalar_shape>(&d.shape))
            {
                if (val.is_map() || val.is_list())
                    return { { pos, expected_match{ { "any scalar" } } } };
                return match(s->match, val, pos);
            }

            if (auto o = std::get_if<one_of_shape>(&d.shape))
            {
                // Every alternative is tried so that each leaves its
                // attempts behind for suggestions.
                std::optional<error_list> best;
                bool matched = false;
                for (auto const & choice : o->choices)
                {
                    auto errors = match(choice, val, pos);
                    if (errors.empty())
                        matched = true;
                    else if (!matched)
                        best = best ? merge(std::move(*best), std::move(errors)) : std::move(errors);
                }
                if (matched || !best)
                    return {};
                return std::move(*best);
            }

            if (auto k = std::get_if<keys_shape>(&d.shape))
                return check_keys(*k, val, pos);

            if (auto i = std::get_if<items_shape>(&d.shape))
                return check_items(*i, val, pos);

            if (!val.empty())
                return { { pos, expected_match{ { "no value" } } } };
            return {};
        }

//---------------------------------------------------------------------------

        inline bool validator::accepts_key(const matcher& m, const token& key)
        {
            if (!m.is_reference())
                return m.matches(key.content);

            // Reference key matchers are checked on the side so they leave
            // no attempts behind.
            node as_value;
            as_value.scalar = key;

            attempt_map scratch;
            validator side(scratch);
            return side.match(m, as_value, key_position(key.line)).empty();
        }

        inline error_list validator::check_keys(const keys_shape& s, const node& val, position pos)
        {
            if (val.is_scalar() || val.is_list())
                return { { pos, expected_match{ { "a map" } } } };

            error_list errors;
            std::vector<bool> seen_required(s.required.size(), false);
            std::set<std::string_view> seen_keys;

            for (auto const & e : val.map)
            {
                position at_key   = key_position(e.key.line);
                position at_value = value_position(e.key.line);

                if (e.key.has_error())
                {
                    errors.push_back({ at_key, decode_error{ *e.key.error } });
                    continue;
                }

                if (!seen_keys.insert(e.key.content).second)
                {
                    errors.push_back({ at_key, duplicate_key{ e.key.content } });
                    continue;
                }

                bool allowed = false;
                for (size_t i = 0; i < s.required.size(); ++i)
                {
                    auto const & rule = s.required[i];
                    if (!accepts_key(rule.key, e.key))
                        continue;

                    allowed = true;
                    if (seen_required[i])
                    {
                        errors.push_back({ at_key, duplicate_key{ rule.key.source } });
                    }
                    else
                    {
                        seen_required[i] = true;
                        append(errors, match(rule.value, e.value, at_value));
                    }
                    break;
                }

                if (!allowed)
                {
                    std::optional<error_list> best;
                    for (auto const & rule : s.optional)
                    {
                        if (!accepts_key(rule.key, e.key))
                            continue;

                        allowed = true;
                        auto result = match(rule.value, e.value, at_value);
                        if (result.empty())
                        {
                            best.reset();
                            break;
                        }
                        best = best ? merge(std::move(*best), std::move(result)) : std::move(result);
                    }
                    if (best)
                        append(errors, std::move(*best));
                }

                if (!allowed)
                    errors.push_back({ at_key, unexpected{ "key " + e.key.content } });
            }

            std::vector<std::string> missing;
            for (size_t i = 0; i < s.required.size(); ++i)
            {
                if (seen_required[i])
                    continue;
                auto names = s.required[i].key.descriptions();
                missing.insert(missing.end(), names.begin(), names.end());
            }
            if (!missing.empty())
                errors.push_back({ pos, missing_required_key{ std::move(missing) } });

            return errors;
        }

//---------------------------------------------------------------------------

        inline error_list validator::check_items(const items_shape& s, const node& val, position pos)
        {
            if (val.is_scalar() || val.is_map())
                return { { pos, expected_match{ { "a list" } } } };

            error_list errors;
            for (size_t i = 0; i < val.list.size(); ++i)
            {
                auto const & item = val.list[i];
                if (item.key.has_error())
                {
                    errors.push_back({ key_position(item.key.line), decode_error{ *item.key.error } });
                    continue;
                }

                if (i < s.required.size())
                    append(errors, match(s.required[i], item.value, value_position(item.key.line)));
                else if (s.rest)
                    append(errors, match(*s.rest, item.value, value_position(item.key.line)));
                else
                    errors.push_back({ key_position(item.key.line), unexpected{ "list item" } });
            }

            if (val.list.size() < s.required.size())
            {
                auto names = s.required[val.list.size()].descriptions();
                errors.push_back({ pos, missing_required_item{ join_with_or(names) } });
            }
            return errors;
        }

//---------------------------------------------------------------------------

        // By reported line, keys before values, the document itself last.
        inline void sort_errors(error_list& errors)
        {
            std::stable_sort(errors.begin(), errors.end(), [](auto const & a, auto const & b)
            {
                if (a.line() != b.line())
                    return a.line() < b.line();
                if (a.pos.part != b.pos.part)
                    return a.pos.part < b.pos.part;
                return !a.pos.is_root() && b.pos.is_root();
            });
        }

        // Collapses raw errors to one per position and orders them.
        inline error_list render(error_list raw)
        {
            std::map<position, error_list> grouped;
            for (auto& e : raw)
                grouped[e.pos].push_back(std::move(e));

            error_list out;
            for (auto& [pos, group] : grouped)
            {
                int top = 3;
                for (auto const & e : group)
                    top = std::min(top, priority(e.problem));

                std::optional<validation_error> chosen;
                for (auto& e : group)
                {
                    if (priority(e.problem) != top)
                        continue;

                    if (!chosen)
                    {
                        chosen = std::move(e);
                        continue;
                    }

                    if (auto into = std::get_if<expected_match>(&chosen->problem))
                    {
                        if (auto more = std::get_if<expected_match>(&e.problem))
                            into->candidates.insert(into->candidates.end(),
                                                    more->candidates.begin(), more->candidates.end());
                    }
                    else if (auto into = std::get_if<missing_required_key>(&chosen->problem))
                    {
                        if (auto more = std::get_if<missing_required_key>(&e.problem))
                            into->keys.insert(into->keys.end(), more->keys.begin(), more->keys.end());
                    }
                }

                if (auto m = std::get_if<expected_match>(&chosen->problem))
                    sort_unique(m->candidates);
                else if (auto m = std::get_if<missing_required_key>(&chosen->problem))
                    sort_unique(m->keys);

                out.push_back(std::move(*chosen));
            }

            sort_errors(out);
            return out;
        }
    }

//---------------------------------------------------------------------------

    inline validation_outcome run_validation(const schema& s, const document& doc)
    {
        validation_outcome out;
        detail::validator v(out.attempts);

        auto raw = v.match(s.root(), doc.root(), value_position(0));
        for (auto const & tok : doc.detached_errors())
            raw.push_back({ value_position(tok.line), decode_error{ *tok.error } });

        out.errors = detail::render(std::move(raw));
        return out;
    }

} // namespace conl

#endif // CONL_VALIDATE_HPP
