#include "doctest.h"

#include "sustainbot/command/dynamic_value.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace sustainbot::tests {

using command::ChoiceList;
using command::TextValue;

TEST_CASE("DynamicValue static values resolve unchanged")
{
    TextValue t{std::string("running")};
    CHECK(!t.is_producer());
    CHECK(command::resolve(t) == "running");

    ChoiceList c{std::vector<std::string>{"a", "b"}};
    auto v = command::try_resolve(c);
    REQUIRE(v.has_value());
    CHECK(*v == std::vector<std::string>{"a", "b"});
}

TEST_CASE("DynamicValue producers are evaluated on every resolve")
{
    int calls = 0;
    TextValue t([&] { ++calls; return std::to_string(calls); });

    CHECK(t.is_producer());
    CHECK(command::resolve(t) == "1");
    CHECK(command::resolve(t) == "2");
    CHECK(calls == 2);
}

TEST_CASE("DynamicValue failing producers degrade to the sentinel")
{
    TextValue t([]() -> std::string { throw std::runtime_error("config map missing"); });
    CHECK(command::resolve(t) == "<error getting value>");

    ChoiceList c([]() -> std::vector<std::string> { throw std::out_of_range("no key"); });
    CHECK(command::try_resolve(c) == std::nullopt);
}

} // namespace sustainbot::tests
