#pragma once

#include "sustainbot/command/dynamic_value.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sustainbot::command {

inline constexpr std::string_view kNoDescription = "No description available";
inline constexpr std::string_view kNoArgumentDescription = "No description";

struct ArgumentSpec {
    std::string name;
    bool        required{false};
    std::string description;

    // Rendered as "(Options: ...)" / "(Default: ...)" in detailed help.
    std::optional<ChoiceList> choices;
    std::optional<TextValue>  default_value;

    static ArgumentSpec required_arg(std::string name, std::string description);
    static ArgumentSpec optional_arg(std::string name, std::string description);

    ArgumentSpec& with_choices(ChoiceList c);
    ArgumentSpec& with_choices(std::vector<std::string> c);
    ArgumentSpec& with_default(TextValue d);
    ArgumentSpec& with_default(std::string d);
};

// Immutable once registered; every dispatch key of a command shares one instance.
struct CommandMeta {
    std::string name;
    std::string description{kNoDescription};

    // Declaration order is rendering order.
    std::vector<ArgumentSpec> arguments;
    std::vector<std::string>  examples;
    std::vector<std::string>  aliases;

    const ArgumentSpec* find_argument(std::string_view arg_name) const;
};

using CommandMetaPtr = std::shared_ptr<const CommandMeta>;

// Fluent declaration of a command's metadata:
//
//   auto meta = CommandMetaBuilder("list-aws-vms")
//       .description("List AWS EC2 instances")
//       .argument(ArgumentSpec::optional_arg("state", "Instance state").with_default("running"))
//       .example("list-aws-vms --state=stopped")
//       .alias("aws-vms")
//       .build();
class CommandMetaBuilder {
public:
    explicit CommandMetaBuilder(std::string name);

    CommandMetaBuilder& description(std::string text);

    // A second argument with the same name replaces the first in place.
    CommandMetaBuilder& argument(ArgumentSpec spec);
    CommandMetaBuilder& example(std::string text);
    CommandMetaBuilder& alias(std::string name);

    CommandMetaPtr build() const;

private:
    CommandMeta _meta;
};

} // namespace sustainbot::command
