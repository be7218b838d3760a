#include "sustainbot/command/command_meta.h"

#include <utility>

namespace sustainbot::command {

ArgumentSpec ArgumentSpec::required_arg(std::string name, std::string description)
{
    ArgumentSpec a;
    a.name = std::move(name);
    a.required = true;
    a.description = std::move(description);
    return a;
}

ArgumentSpec ArgumentSpec::optional_arg(std::string name, std::string description)
{
    ArgumentSpec a;
    a.name = std::move(name);
    a.required = false;
    a.description = std::move(description);
    return a;
}

ArgumentSpec& ArgumentSpec::with_choices(ChoiceList c)
{
    choices.emplace(std::move(c));
    return *this;
}

ArgumentSpec& ArgumentSpec::with_choices(std::vector<std::string> c)
{
    choices.emplace(ChoiceList(std::move(c)));
    return *this;
}

ArgumentSpec& ArgumentSpec::with_default(TextValue d)
{
    default_value.emplace(std::move(d));
    return *this;
}

ArgumentSpec& ArgumentSpec::with_default(std::string d)
{
    default_value.emplace(TextValue(std::move(d)));
    return *this;
}

const ArgumentSpec* CommandMeta::find_argument(std::string_view arg_name) const
{
    for (const auto& a : arguments) {
        if (a.name == arg_name) return &a;
    }
    return nullptr;
}

CommandMetaBuilder::CommandMetaBuilder(std::string name)
{
    _meta.name = std::move(name);
}

CommandMetaBuilder& CommandMetaBuilder::description(std::string text)
{
    _meta.description = text.empty() ? std::string(kNoDescription) : std::move(text);
    return *this;
}

CommandMetaBuilder& CommandMetaBuilder::argument(ArgumentSpec spec)
{
    for (auto& a : _meta.arguments) {
        if (a.name == spec.name) {
            a = std::move(spec);
            return *this;
        }
    }
    _meta.arguments.push_back(std::move(spec));
    return *this;
}

CommandMetaBuilder& CommandMetaBuilder::example(std::string text)
{
    _meta.examples.push_back(std::move(text));
    return *this;
}

CommandMetaBuilder& CommandMetaBuilder::alias(std::string name)
{
    _meta.aliases.push_back(std::move(name));
    return *this;
}

CommandMetaPtr CommandMetaBuilder::build() const
{
    return std::make_shared<const CommandMeta>(_meta);
}

} // namespace sustainbot::command
