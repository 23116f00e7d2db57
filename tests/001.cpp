#include "utils.hpp"

namespace apiguard::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: guard_mode and output_mode parsing", "[001][config]") {
        guard_mode mode = guard_mode::semver;

        REQUIRE(try_parse_guard_mode("strict"sv, mode));
        CHECK(mode == guard_mode::strict);
        REQUIRE(try_parse_guard_mode("SemVer"sv, mode));
        CHECK(mode == guard_mode::semver);
        CHECK_FALSE(try_parse_guard_mode("lenient"sv, mode));
        CHECK(mode == guard_mode::semver);

        output_mode out = output_mode::table;
        REQUIRE(try_parse_output_mode("JSON"sv, out));
        CHECK(out == output_mode::json);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, out));

        CHECK(to_string(guard_mode::semver) == "semver"sv);
        CHECK(to_string(guard_mode::strict) == "strict"sv);
        CHECK(to_string(output_mode::json) == "json"sv);
    }

    TEST_CASE("001: config defaults apply for omitted keys", "[001][config]") {
        auto cfg = parse_config(R"({"targets":["Core"]})"sv);

        REQUIRE(cfg.targets == std::vector<std::string>{"Core"});
        CHECK(cfg.mode == guard_mode::semver);
        CHECK(cfg.baseline_dir == std::filesystem::path{"api-baseline"});
        CHECK(cfg.output_dir == std::filesystem::path{".build/apiguard"});
        CHECK_FALSE(cfg.fail_on_additions);
        CHECK(cfg.export_command == std::vector<std::string>{"swift", "package", "dump-symbol-graph"});
        CHECK(cfg.symbol_graph_dir == std::filesystem::path{".build/symbol-graphs"});
        CHECK(cfg.export_timeout == std::chrono::minutes{10});
    }

    TEST_CASE("001: config reads every key and ignores unknown ones", "[001][config]") {
        auto cfg = parse_config(R"({
            "targets": ["Core", "Net"],
            "mode": "strict",
            "baselineDir": "baselines",
            "outputDir": "out",
            "failOnAdditions": true,
            "exportCommand": ["make", "symbols"],
            "symbolGraphDir": "graphs",
            "exportTimeoutMs": 1500,
            "comment": "not a config key"
        })"sv);

        CHECK(cfg.targets == std::vector<std::string>{"Core", "Net"});
        CHECK(cfg.mode == guard_mode::strict);
        CHECK(cfg.baseline_dir == std::filesystem::path{"baselines"});
        CHECK(cfg.output_dir == std::filesystem::path{"out"});
        CHECK(cfg.fail_on_additions);
        CHECK(cfg.export_command == std::vector<std::string>{"make", "symbols"});
        CHECK(cfg.symbol_graph_dir == std::filesystem::path{"graphs"});
        CHECK(cfg.export_timeout == std::chrono::milliseconds{1500});
    }

    TEST_CASE("001: invalid configs are config_invalid", "[001][config]") {
        auto kind_of = [](std::string_view json) { return detail::thrown_kind([json] { (void)parse_config(json); }); };

        CHECK(kind_of(R"({"mode":"semver"})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":[]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["  "]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["Core"],"mode":"lenient"})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["Core"],"exportCommand":[]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["Core"],"exportTimeoutMs":0})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":"Core"})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"(not json)"sv) == error_kind::config_invalid);
    }

    TEST_CASE("001: target names must stay inside the tool's directories", "[001][config]") {
        auto kind_of = [](std::string_view json) { return detail::thrown_kind([json] { (void)parse_config(json); }); };

        CHECK(kind_of(R"({"targets":["../../Sources"]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["Core","/tmp/evil"]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["Sub/Core"]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["Sub\\Core"]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":["."]})"sv) == error_kind::config_invalid);
        CHECK(kind_of(R"({"targets":[".."]})"sv) == error_kind::config_invalid);

        auto cfg = parse_config(R"({"targets":["Core.Extras","my-lib_2","..Dots"]})"sv);
        CHECK(cfg.targets == std::vector<std::string>{"Core.Extras", "my-lib_2", "..Dots"});
    }

    TEST_CASE("001: load_config from disk", "[001][config]") {
        detail::temp_dir tmp{"apiguard_001"};

        CHECK(detail::thrown_kind([&] { (void)load_config(tmp.path / "missing.json"); }) ==
              error_kind::config_not_found);

        auto path = tmp.path / ".apiguard.json";
        detail::write_text_file(path, R"({"targets":["Core"],"mode":"strict"})");
        auto cfg = load_config(path);
        CHECK(cfg.targets == std::vector<std::string>{"Core"});
        CHECK(cfg.mode == guard_mode::strict);
    }

}  // namespace apiguard::test
