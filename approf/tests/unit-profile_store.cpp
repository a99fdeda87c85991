#include "doctest_compatibility.h"

#include "approf/file_utils.hpp"
#include "approf/profile_store.hpp"

#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;
using namespace std::string_view_literals;

TEST_CASE("profile naming test")
{
  SECTION("name from file name")
  {
    REQUIRE_EQ(approf::profile_name_from_filename("games.am.json"sv), "games");
    REQUIRE_EQ(approf::profile_name_from_filename("games.json"sv), "games");
    REQUIRE_EQ(approf::profile_name_from_filename("games"sv), "games");
  }
  SECTION("id from profile name")
  {
    REQUIRE_EQ(approf::profile_id_for("Social Media"sv), "Social_Media");
    REQUIRE_EQ(approf::profile_id_for("  work/personal  "sv), "work_personal");
    REQUIRE_EQ(approf::profile_id_for("a:b*c?"sv), "a_b_c_");
  }
  SECTION("unusable names get a random id")
  {
    const auto& first  = approf::profile_id_for(".."sv);
    const auto& second = approf::profile_id_for("   "sv);
    REQUIRE_EQ(first.size(), 36);
    REQUIRE_EQ(first[14], '4');
    REQUIRE_EQ(second.size(), 36);
    REQUIRE_NE(first, second);
  }
}

TEST_CASE("profile store test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
      // noop
  });
  auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
  spdlog::set_default_logger(logger);

  const auto& profiles_dir = fs::temp_directory_path() / "approf-store-test";
  fs::remove_all(profiles_dir);

  const approf::ProfileStore store{profiles_dir.string()};

  SECTION("missing directory")
  {
    REQUIRE(store.list_names().empty());
    REQUIRE(store.list().empty());
    REQUIRE(store.remove("nothing"sv));

    const auto& result = store.load("nothing"sv);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().find("Profile 'nothing' does not exist") != std::string::npos);
  }
  SECTION("save and load")
  {
    approf::Profile profile{.profile_id = "games", .name = "Games", .packages = {"com.game"}};
    profile.freeze = true;
    REQUIRE(store.save(profile));
    REQUIRE(fs::exists(store.path_for("games"sv)));
    REQUIRE_EQ(store.path_for("games"sv), (profiles_dir / "games.am.json").string());

    const auto& loaded = store.load("games"sv);
    REQUIRE(loaded.has_value());
    REQUIRE_EQ(*loaded, profile);
  }
  SECTION("id falls back to the file name")
  {
    fs::create_directories(profiles_dir);
    REQUIRE(approf::file_utils::create_file_for_overwrite((profiles_dir / "legacy.am.json").string(),
        R"({"name": "Legacy", "packages": ["com.a"]})"sv));

    const auto& loaded = store.load("legacy"sv);
    REQUIRE(loaded.has_value());
    REQUIRE_EQ(loaded->profile_id, "legacy");
  }
  SECTION("listing skips broken documents")
  {
    REQUIRE(store.save(approf::Profile{.profile_id = "b", .name = "B", .packages = {"com.b"}}));
    REQUIRE(store.save(approf::Profile{.profile_id = "a", .name = "A", .packages = {"com.a"}}));
    REQUIRE(approf::file_utils::create_file_for_overwrite((profiles_dir / "broken.am.json").string(), "{"sv));
    REQUIRE(approf::file_utils::create_file_for_overwrite((profiles_dir / "notes.txt").string(), "text"sv));

    REQUIRE_EQ(store.list_names(), std::vector<std::string>{"a", "b", "broken"});

    const auto& profiles = store.list();
    REQUIRE_EQ(profiles.size(), 2);
    REQUIRE_EQ(profiles[0].name, "A");
    REQUIRE_EQ(profiles[1].name, "B");

    const auto& broken = store.load("broken"sv);
    REQUIRE(!broken.has_value());
    REQUIRE(broken.error().find("Failed to parse profile") != std::string::npos);
  }
  SECTION("remove")
  {
    REQUIRE(store.save(approf::Profile{.profile_id = "gone", .name = "Gone"}));
    REQUIRE(store.remove("gone"sv));
    REQUIRE(!fs::exists(store.path_for("gone"sv)));
    REQUIRE(store.list_names().empty());
  }
  SECTION("summaries")
  {
    approf::Profile profile{.profile_id = "s", .name = "S", .packages = {"com.a", "com.b"}};
    profile.components = std::vector<std::string>{"c"};
    profile.clear_data = true;
    REQUIRE(store.save(profile));
    REQUIRE(store.save(approf::Profile{.profile_id = "t", .name = "T", .packages = {"com.a"}}));

    const auto& summaries = store.summaries();
    REQUIRE_EQ(summaries.size(), 2);
    REQUIRE_EQ(summaries[0].summary, "2 packages: block/unblock components, clear data");
    REQUIRE_EQ(summaries[1].summary, "1 packages, no operations");
  }
  SECTION("summaries stop when requested")
  {
    REQUIRE(store.save(approf::Profile{.profile_id = "s", .name = "S"}));

    std::stop_source stop_source{};
    stop_source.request_stop();
    REQUIRE(store.summaries(stop_source.get_token()).empty());
  }

  fs::remove_all(profiles_dir);
}
