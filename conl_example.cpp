#include "include/conl.hpp"
#include <iostream>
#include <iomanip>

// Example schema for a small game server configuration
const char* example_schema = R"(
root = <server>
definitions
  server
    docs = A game server
    required keys
      name = <name>
      port = <port>
    keys
      schema = .*
      mode = <mode>
      regions = <regions>
      admins
        matches = <admins>
        docs = People allowed to kick players
  name
    scalar = .+
  port
    docs = TCP port to listen on
    scalar = \d+
  mode
    one of
      =
        matches = pvp
        docs = Players may attack each other
      = pve
      = creative
  regions
    keys
      us|eu|asia = <region>
  region
    required keys
      address = .+
    keys
      max_players = \d+
  admins
    items = .+
)";

// Example CONL configuration
const char* example_config = R"(
; Game server configuration
schema = game server
name = Epic Quest
port = 7777
mode = pvp

regions
  eu
    address = game-eu.example.com
    max_players = 128
  us
    address = game-us.example.com

admins
  = alice
  = bob
)";

const char* broken_config = R"(
name = Epic Quest
port = seven
mode = arena
regions
  mars
    address = far.away
  eu
    max_players = 12
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_node(const conl::node& n, int depth)
{
    std::string pad(depth * 2, ' ');
    for (auto const & e : n.map)
    {
        std::cout << pad << e.key.content;
        if (e.value.is_scalar())
            std::cout << " = " << e.value.scalar->content;
        std::cout << "\n";
        print_node(e.value, depth + 1);
    }
    for (auto const & e : n.list)
    {
        std::cout << pad << "=";
        if (e.value.is_scalar())
            std::cout << " " << e.value.scalar->content;
        std::cout << "\n";
        print_node(e.value, depth + 1);
    }
}

void test_tokens()
{
    print_separator("TEST 1: Token Stream");

    conl::token_stream stream(example_config, { .skip_trivia = true });
    size_t count = 0;
    while (auto tok = stream.next())
    {
        if (count++ >= 12)
            continue;
        std::cout << "  " << std::setw(3) << tok->line << "  "
                  << std::left << std::setw(18) << conl::to_string(tok->kind) << std::right
                  << tok->content << "\n";
    }
    std::cout << "  ... " << count << " tokens in total\n";
}

void test_document()
{
    print_separator("TEST 2: Document Tree");

    auto doc = conl::parse_document(example_config);
    print_node(doc.root(), 1);

    if (auto e = doc.find_entry(11))
        std::cout << "\nLine 11 holds key '" << e->key.content << "'\n";
}

void test_schema()
{
    print_separator("TEST 3: Schema Compilation");

    auto ctx = conl::parse_schema(example_schema);
    if (ctx.has_errors())
    {
        std::cout << "✗ Schema rejected:\n";
        for (auto const & err : ctx.errors)
            std::cout << "  " << err.message << "\n";
        return;
    }

    std::cout << "✓ Compiled " << ctx.result.definition_count() << " definitions\n";

    auto bad = conl::parse_schema("root = <nowhere>\n");
    for (auto const & err : bad.errors)
        std::cout << "  expected failure: " << err.loc.line << ": " << err.message << "\n";
}

void test_validation()
{
    print_separator("TEST 4: Validation");

    auto ctx = conl::parse_schema(example_schema);
    if (ctx.has_errors())
        return;

    auto good = conl::validate(ctx.result, example_config);
    std::cout << (good.valid() ? "✓ Example configuration is valid\n" : "✗ Example configuration rejected\n");

    auto bad = conl::validate(ctx.result, broken_config);
    std::cout << "\nBroken configuration, " << bad.errors().size() << " errors:\n";
    for (auto const & err : bad.errors())
        std::cout << "  " << err.str() << "\n";
}

void test_suggestions()
{
    print_separator("TEST 5: Suggestions and Documentation");

    auto ctx = conl::parse_schema(example_schema);
    if (ctx.has_errors())
        return;

    auto r = conl::validate(ctx.result, example_config);

    std::cout << "Keys that could still be added at the top level:\n";
    for (auto const & s : r.suggested_keys(0))
        std::cout << "  " << s.value << (s.docs.empty() ? "" : "  ; " + s.docs) << "\n";

    std::cout << "\nValues for 'mode' (line 6):\n";
    for (auto const & s : r.suggested_values(6).values)
        std::cout << "  " << s.value << (s.docs.empty() ? "" : "  ; " + s.docs) << "\n";

    std::cout << "\nDocs for 'port' key:   " << r.docs_for_key(5) << "\n";
    std::cout << "Docs for 'mode' value: " << r.docs_for_value(6) << "\n";
}

void test_loader()
{
    print_separator("TEST 6: Schema Loading");

    auto ctx = conl::parse_schema(example_schema);
    if (ctx.has_errors())
        return;

    auto loader = [&](std::string_view name) -> conl::loaded_schema
    {
        if (name == "game server")
            return { &ctx.result, std::nullopt };
        if (name.empty())
            return {};
        return { nullptr, "no schema called " + std::string(name) };
    };

    auto chosen = conl::validate(example_config, loader);
    std::cout << "Named schema: " << (chosen.valid() ? "valid" : "invalid") << "\n";

    auto unknown = conl::validate("schema = spaceship\nthrust = 9000\n", loader);
    for (auto const & err : unknown.errors())
        std::cout << "  " << err.str() << "\n";
}

void test_error_handling()
{
    print_separator("TEST 7: Malformed Input");

    const char* input = "a = \"unterminated\n  b = 1\nc = \"\"\"\n";
    auto r = conl::validate(conl::any_schema(), input);
    for (auto const & err : r.errors())
        std::cout << "  " << err.str() << "\n";
}

int main()
{
    test_tokens();
    test_document();
    test_schema();
    test_validation();
    test_suggestions();
    test_loader();
    test_error_handling();

    print_separator("DONE");
    return 0;
}
