#include "doctest_compatibility.h"

#include "cli.hpp"

#include <array>
#include <string_view>

using namespace std::string_view_literals;

TEST_CASE("cli parsing test")
{
  SECTION("list")
  {
    constexpr std::array args{"list"sv};
    const auto& command = profilectl::parse_cli(args);
    REQUIRE(command.has_value());
    REQUIRE_EQ(command->action, profilectl::CliAction::List);
  }
  SECTION("apply with profile state")
  {
    constexpr std::array args{"apply"sv, "games"sv};
    const auto& command = profilectl::parse_cli(args);
    REQUIRE(command.has_value());
    REQUIRE_EQ(command->action, profilectl::CliAction::Apply);
    REQUIRE_EQ(command->argument, "games");
    REQUIRE(!command->state.has_value());
  }
  SECTION("apply with explicit state")
  {
    constexpr std::array args{"apply"sv, "games"sv, "off"sv};
    const auto& command = profilectl::parse_cli(args);
    REQUIRE(command.has_value());
    REQUIRE_EQ(command->state, "off");
  }
  SECTION("delete")
  {
    constexpr std::array args{"delete"sv, "games"sv};
    const auto& command = profilectl::parse_cli(args);
    REQUIRE(command.has_value());
    REQUIRE_EQ(command->action, profilectl::CliAction::Delete);
    REQUIRE_EQ(command->argument, "games");
  }
  SECTION("id")
  {
    constexpr std::array args{"id"sv, "Social Media"sv};
    const auto& command = profilectl::parse_cli(args);
    REQUIRE(command.has_value());
    REQUIRE_EQ(command->action, profilectl::CliAction::Id);
    REQUIRE_EQ(command->argument, "Social Media");
  }
  SECTION("usage errors")
  {
    REQUIRE(!profilectl::parse_cli({}).has_value());

    constexpr std::array unknown{"run"sv, "games"sv};
    REQUIRE(!profilectl::parse_cli(unknown).has_value());

    constexpr std::array missing_id{"apply"sv};
    REQUIRE(!profilectl::parse_cli(missing_id).has_value());

    constexpr std::array too_many{"apply"sv, "games"sv, "on"sv, "now"sv};
    REQUIRE(!profilectl::parse_cli(too_many).has_value());

    constexpr std::array list_extra{"list"sv, "all"sv};
    REQUIRE(!profilectl::parse_cli(list_extra).has_value());
  }
}
