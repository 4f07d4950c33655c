#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/cfg/argv.h>
#include <spdlog/fmt/fmt.h>

#include "stanza/stanza.hpp"

struct Person {
    std::string name;
    int age = 0;
    std::vector<std::string> emails;
};

void describe(Stanza::type_tag<Person>, Stanza::ObjectBuilder<Person>& b) {
    b.named("Person");
    b.field("Name", &Person::name).required().length(1, 40);
    b.field("Age", &Person::age).range(0, 150);
    b.field("Emails", &Person::emails);
}

// Usage: stanza_read_body [file] [content-type] [SPDLOG_LEVEL=stanza.decoder=debug]
int main(int argc, char** argv) {
    spdlog::cfg::load_argv_levels(argc, argv);

    std::string content_type = argc > 2 ? argv[2] : "application/json";

    Stanza::JsonInputFormatter formatter;
    if (!formatter.can_read(content_type)) {
        fmt::print(stderr, "Cannot read content type '{}'\n", content_type);
        return 2;
    }

    Stanza::ErrorCollection errors;
    errors.set_max_allowed_errors(20);
    Stanza::InputFormatterContext ctx{ content_type, "person", errors, Stanza::describe<Person>() };

    Stanza::DecodeResult result = Stanza::DecodeResult::no_value();
    if (argc > 1) {
        std::ifstream ifs(argv[1]);
        if (!ifs) {
            fmt::print(stderr, "Failed to open {}\n", argv[1]);
            return 1;
        }
        result = formatter.read(ctx, ifs);
    } else {
        result = formatter.read(ctx, std::cin);
    }

    if (result.has_error()) {
        fmt::print("{}\n", Stanza::dump(Stanza::to_value(errors), { .pretty = true, .indent = 4 }));
        return 1;
    }
    if (!result.is_model_set()) {
        fmt::print("No value.\n");
        return 0;
    }

    auto person = result.model_as<Person>();
    fmt::print("{} ({}), {} email(s)\n", person.name, person.age, person.emails.size());
    fmt::print("{}\n", Stanza::dump(Stanza::to_value(result.model()), { .pretty = true }));
    return 0;
}
