// conl.hpp - CONL - Configuration language lexer and schema validation
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// CONL Core Principles:
//========================================================================
//
// The Tolerance Principle
// -----------------------
// Any input produces a token stream and a document.
// Decode problems travel with the token that caused them.
// Scanning never stops early.
//
//
// The Shape Principle
// -------------------
// A value is a scalar, a map, a list or nothing.
// A schema says which shape belongs where, and what scalars look like.
//
//
// The Diagnosis Principle
// -----------------------
// Validation reports every problem it can attribute to a line.
// When several rules could apply, the one that got furthest speaks.
//
//
// The Assistance Principle
// ------------------------
// What validation tried at a line is what may be written there.
// Suggestions and documentation are answers read back from that record.
//
//========================================================================

#ifndef CONL_CONFIGURATION_LANGUAGE
#define CONL_CONFIGURATION_LANGUAGE

#include "conl_core.hpp"
#include "conl_lexer.hpp"
#include "conl_tokens.hpp"
#include "conl_document.hpp"
#include "conl_schema.hpp"
#include "conl_validate.hpp"
#include "conl_suggest.hpp"

#include <functional>

namespace conl
{
    struct schema_options
    {
        bool check_meta_schema = true;  // validate the schema text against meta_schema() first
    };

//========================================================================
// Validation result
//========================================================================

    // Owns the parsed document and what validation learned about it.
    // Refers to the schema it was validated against, which must outlive it.
    class result
    {
    public:
        result(document doc, validation_outcome outcome, const schema& used)
            : doc_(std::move(doc))
            , errors_(std::move(outcome.errors))
            , attempts_(std::move(outcome.attempts))
            , schema_(&used)
        {}

        bool valid() const noexcept { return errors_.empty(); }

        const std::vector<validation_error>& errors() const noexcept { return errors_; }

        // Keys that could be added to the map introduced on the given line
        // (0 for the document itself), without the ones already present.
        std::vector<suggestion> suggested_keys(size_t line) const
        {
            return suggest_keys(doc_, attempts_, line);
        }

        value_suggestions suggested_values(size_t line) const
        {
            return suggest_values(attempts_, line);
        }

        std::string docs_for_key(size_t line) const   { return conl::docs_for_key(attempts_, line); }
        std::string docs_for_value(size_t line) const { return conl::docs_for_value(attempts_, line); }

        const document& doc() const noexcept      { return doc_; }
        const schema& used_schema() const noexcept { return *schema_; }

    private:
        document                      doc_;
        std::vector<validation_error> errors_;
        attempt_map                   attempts_;
        const schema*                 schema_;
    };

//========================================================================
// Schema loading
//========================================================================

    struct loaded_schema
    {
        const schema*              found = nullptr;   // nullptr selects any_schema()
        std::optional<std::string> error;
    };

    // Maps the name given by a document's top-level "schema" key (empty
    // when absent) to a schema.
    using schema_loader = std::function<loaded_schema(std::string_view name)>;

//========================================================================
// API
//========================================================================

    schema_context parse_schema(std::string_view text, schema_options opt = {});

    result validate(const schema& s, std::string_view input);
    result validate(std::string_view input, schema_loader const & loader);

    // Matches any document.
    const schema& any_schema();

    // Matches any valid schema document, itself included.
    const schema& meta_schema();

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        constexpr std::string_view ANY_SCHEMA_TEXT =
R"(root = <any>
definitions
  any
    one of
      = <scalar>
      = <map>
      = <list>
      = <none>
  scalar
    scalar = .*
  map
    keys
      .* = <any>
  list
    items = <any>
  none
)";

        constexpr std::string_view META_SCHEMA_TEXT =
R"(root = <schema>
definitions
  schema
    required keys
      root = <matcher>
    keys
      definitions = <definitions>
  definitions
    keys
      .* = <definition>
  definition
    one of
      = <empty>
      = <rules>
  empty
  rules
    keys
      docs = <docs>
      scalar = <matcher>
      one of = <matcher list>
      keys = <key rules>
      required keys = <key rules>
      items = <matcher>
      required items = <matcher list>
  docs
    one of
      = <text>
      = <empty>
  text
    scalar = .+
  matcher
    one of
      = <pattern>
      = <documented matcher>
  pattern
    scalar = .+
  documented matcher
    required keys
      matches = <pattern>
    keys
      docs = <docs>
  matcher list
    items = <matcher>
  key rules
    keys
      .* = <matcher>
)";

        // The built-in texts are fixed and covered by tests, so their
        // compile errors are not consulted here.
        inline schema builtin_schema(std::string_view text)
        {
            return std::move(compile_schema(parse_document(text)).result);
        }
    }

//---------------------------------------------------------------------------

    inline const schema& any_schema()
    {
        static const schema instance = detail::builtin_schema(detail::ANY_SCHEMA_TEXT);
        return instance;
    }

    inline const schema& meta_schema()
    {
        static const schema instance = detail::builtin_schema(detail::META_SCHEMA_TEXT);
        return instance;
    }

//---------------------------------------------------------------------------

    inline schema_context parse_schema(std::string_view text, schema_options opt)
    {
        document doc = parse_document(text);

        if (opt.check_meta_schema)
        {
            auto checked = run_validation(meta_schema(), doc);
            if (!checked.errors.empty())
            {
                schema_context out;
                for (auto const & e : checked.errors)
                {
                    out.errors.push_back({
                        schema_error_kind::invalid_document,
                        { e.line() },
                        "invalid schema: " + e.str()
                    });
                }
                return out;
            }
        }

        return compile_schema(doc);
    }

//---------------------------------------------------------------------------

    inline result validate(const schema& s, std::string_view input)
    {
        document doc = parse_document(input);
        auto outcome = run_validation(s, doc);
        return result(std::move(doc), std::move(outcome), s);
    }

    inline result validate(std::string_view input, schema_loader const & loader)
    {
        document doc = parse_document(input);
        const schema* chosen = &any_schema();
        std::optional<validation_error> load_error;

        // An empty document is valid whatever it claims to be.
        if (loader && !doc.root().empty())
        {
            std::string name;
            size_t line = 1;
            for (auto const & e : doc.root().map)
            {
                if (e.key.has_error() || e.key.content != "schema")
                    continue;

                line = e.key.line;
                if (e.value.is_scalar() && !e.value.scalar->has_error())
                    name = e.value.scalar->content;
                break;
            }

            loaded_schema loaded = loader(name);
            if (loaded.error)
                load_error = validation_error{ key_position(line), schema_load_error{ *loaded.error } };
            else if (loaded.found)
                chosen = loaded.found;
        }

        auto outcome = run_validation(*chosen, doc);
        if (load_error)
        {
            outcome.errors.push_back(std::move(*load_error));
            detail::sort_errors(outcome.errors);
        }
        return result(std::move(doc), std::move(outcome), *chosen);
    }

} // namespace conl

#endif // CONL_CONFIGURATION_LANGUAGE
