#include "doctest.h"

#include "sustainbot/command/suggest.h"

#include <string>
#include <vector>

namespace sustainbot::tests {

using command::levenshtein_distance;
using command::suggest_commands;

TEST_CASE("levenshtein_distance")
{
    CHECK(levenshtein_distance("", "") == 0);
    CHECK(levenshtein_distance("abc", "") == 3);
    CHECK(levenshtein_distance("kitten", "sitting") == 3);
    CHECK(levenshtein_distance("list-asw-vms", "list-aws-vms") == 2);
}

TEST_CASE("suggest_commands prefers substring matches and keeps them sorted")
{
    const std::vector<std::string> keys{"list-aws-vms", "aws-vms", "create-aws-vm", "hello", "hi"};

    CHECK(suggest_commands("aws", keys) == std::vector<std::string>{"aws-vms", "create-aws-vm", "list-aws-vms"});
    CHECK(suggest_commands("AWS", keys) == std::vector<std::string>{"aws-vms", "create-aws-vm", "list-aws-vms"});
}

TEST_CASE("suggest_commands catches near misses by edit distance")
{
    const std::vector<std::string> keys{"list-aws-vms", "hello", "list-openstack-vms"};

    CHECK(suggest_commands("list-asw-vms", keys) == std::vector<std::string>{"list-aws-vms"});
    CHECK(suggest_commands("helo", keys) == std::vector<std::string>{"hello"});
    CHECK(suggest_commands("xyzzy", keys).empty());
}

TEST_CASE("suggest_commands ranks substring hits before edit-distance hits")
{
    const std::vector<std::string> keys{"vms", "vm", "os-vms"};
    // "vm" is inside all three keys.
    CHECK(suggest_commands("vm", keys) == std::vector<std::string>{"os-vms", "vm", "vms"});
    // "vmx" is within distance 1 of "vm" and "vms", and 3 of "os-vms".
    CHECK(suggest_commands("vmx", keys) == std::vector<std::string>{"vm", "vms"});
}

TEST_CASE("suggest_commands honours the result cap and empty input")
{
    std::vector<std::string> keys;
    for (int i = 0; i < 8; ++i) keys.push_back("cmd-" + std::to_string(i));

    CHECK(suggest_commands("cmd", keys).size() == 5);
    CHECK(suggest_commands("cmd", keys, 2) == std::vector<std::string>{"cmd-0", "cmd-1"});
    CHECK(suggest_commands("", keys).empty());
}

TEST_CASE("join")
{
    CHECK(command::join({}) == "");
    CHECK(command::join({"a"}) == "a");
    CHECK(command::join({"a", "b", "c"}) == "a, b, c");
    CHECK(command::join({"a", "b"}, "|") == "a|b");
}

} // namespace sustainbot::tests
