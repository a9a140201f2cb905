#include <catch2/catch_test_macros.hpp>
#include "sskr/models/split_spec.hpp"
#include <vector>

using namespace sskr;
using namespace sskr::models;

TEST_CASE("GroupSpec - Validation", "[models][split-spec]") {
    SECTION("Valid bounds") {
        REQUIRE(GroupSpec::Create(1, 1).IsOk());
        REQUIRE(GroupSpec::Create(2, 3).IsOk());
        REQUIRE(GroupSpec::Create(16, 16).IsOk());
    }
    SECTION("Threshold zero") {
        auto result = GroupSpec::Create(0, 3);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SskrFailureType::InvalidParameters);
    }
    SECTION("Threshold above count") {
        REQUIRE(GroupSpec::Create(4, 3).IsErr());
    }
    SECTION("Count above sixteen") {
        REQUIRE(GroupSpec::Create(2, 17).IsErr());
    }
    SECTION("Count zero") {
        REQUIRE(GroupSpec::Create(0, 0).IsErr());
    }
    SECTION("Getters and description") {
        const auto group = GroupSpec::Create(3, 5).Unwrap();
        REQUIRE(group.GetMemberThreshold() == 3);
        REQUIRE(group.GetMemberCount() == 5);
        REQUIRE(group.ToString() == "3-of-5");
    }
}

TEST_CASE("SplitSpec - Validation", "[models][split-spec]") {
    const auto two_of_three = GroupSpec::Create(2, 3).Unwrap();
    const auto three_of_five = GroupSpec::Create(3, 5).Unwrap();

    SECTION("Two groups") {
        auto result = SplitSpec::Create(2, {two_of_three, three_of_five});
        REQUIRE(result.IsOk());
        const auto& spec = result.Unwrap();
        REQUIRE(spec.GetGroupThreshold() == 2);
        REQUIRE(spec.GetGroupCount() == 2);
        REQUIRE(spec.GetGroups()[1] == three_of_five);
        REQUIRE(spec.GetShareCount() == 8);
        REQUIRE(spec.ToString() == "2 of [2-of-3, 3-of-5]");
    }
    SECTION("No groups") {
        auto result = SplitSpec::Create(1, {});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SskrFailureType::InvalidParameters);
    }
    SECTION("Seventeen groups") {
        std::vector<GroupSpec> groups(17, two_of_three);
        REQUIRE(SplitSpec::Create(1, groups).IsErr());
    }
    SECTION("Sixteen groups") {
        std::vector<GroupSpec> groups(16, two_of_three);
        REQUIRE(SplitSpec::Create(16, groups).IsOk());
    }
    SECTION("Group threshold above group count") {
        REQUIRE(SplitSpec::Create(3, {two_of_three, three_of_five}).IsErr());
    }
    SECTION("Group threshold zero") {
        REQUIRE(SplitSpec::Create(0, {two_of_three}).IsErr());
    }
    SECTION("Single group shorthand") {
        auto result = SplitSpec::SingleGroup(2, 3);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().GetGroupCount() == 1);
        REQUIRE(result.Unwrap().GetGroups()[0] == two_of_three);
        REQUIRE(SplitSpec::SingleGroup(4, 3).IsErr());
    }
}
