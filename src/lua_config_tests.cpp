#include "lua_config.h"

#include "install_plan.h"
#include "session.h"
#include "test_support.h"

#include <doctest/doctest.h>

#include <stdexcept>

using namespace std::chrono_literals;

namespace {

struct lua_fixture {
  pakt::test::temp_dir root;
  pakt::lua_config lua{ root.path };
  pakt::session sess;

  lua_fixture() { lua.bind(sess); }

  pakt::install_plan plan() const {
    return pakt::build_install_plan(sess.queued(), sess.cfg().default_host);
  }
};

pakt::single_plugin const &as_single(pakt::plugin_source const &src) {
  return std::get<pakt::single_plugin>(src.v);
}

}  // namespace

TEST_CASE_FIXTURE(lua_fixture, "pakt.src registers a string identifier") {
  lua.run(R"(pakt.src("owner/repo"))");
  REQUIRE(sess.queued().size() == 1);
  CHECK(std::get<pakt::source_identifier>(sess.queued()[0].v).value == "owner/repo");
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.src reads a plugin table") {
  lua.run(R"(
    pakt.src({
      src = "o/app",
      version = "v2",
      priority = 50,
      ratio = 0.5,
      enabled = true,
      name = "app",
      nested = { ignored = true },
      event = "BufRead",
      deps = { "o/dep1", { src = "o/dep2" } },
    })
  )");
  REQUIRE(sess.queued().size() == 1);
  auto const &p{ as_single(sess.queued()[0]) };
  CHECK(p.src == "o/app");
  CHECK(p.version == "v2");
  CHECK(std::get<std::int64_t>(p.options.at("priority")) == 50);
  CHECK(std::get<double>(p.options.at("ratio")) == doctest::Approx(0.5));
  CHECK(std::get<bool>(p.options.at("enabled")));
  CHECK(std::get<std::string>(p.options.at("name")) == "app");
  CHECK_FALSE(p.options.contains("nested"));
  CHECK_FALSE(p.options.contains("deps"));
  CHECK_FALSE(p.options.contains("event"));
  CHECK(p.events == std::vector<std::string>{ "BufRead" });
  REQUIRE(p.deps.size() == 2);
  CHECK(std::holds_alternative<pakt::source_identifier>(p.deps[0].v));
  CHECK(as_single(p.deps[1]).src == "o/dep2");
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.src accepts a single dep and an event list") {
  lua.run(R"(pakt.src({ src = "o/a", deps = "o/b", event = { "BufRead", "InsertEnter" } }))");
  auto const &p{ as_single(sess.queued().at(0)) };
  REQUIRE(p.deps.size() == 1);
  CHECK(p.events == std::vector<std::string>{ "BufRead", "InsertEnter" });
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.src treats a table without src as a group") {
  lua.run(R"(pakt.src({ "o/a", { "o/b", "o/c" }, { src = "o/d" } }))");
  auto const p{ plan() };
  REQUIRE(p.plugins.size() == 4);
  CHECK(p.plugins[3].source == "https://github.com/o/d");
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.src ignores nil without reporting an error") {
  pakt::test::log_capture log;
  lua.run(R"(
    pakt.src(nil)
    pakt.src()
    pakt.src({ src = "o/app", deps = nil })
  )");
  log.stop();
  REQUIRE(sess.queued().size() == 1);
  CHECK_FALSE(log.contains("expected a string or a table"));

  auto const p{ plan() };
  CHECK(p.skipped == 0);
  REQUIRE(p.plugins.size() == 1);
  CHECK(p.plugins[0].source == "https://github.com/o/app");
}

TEST_CASE("lua_to_plugin_source turns nil into an empty group") {
  sol::object const nil_value{ sol::lua_nil };
  auto const src{ pakt::lua_to_plugin_source(nil_value, "ctx") };
  REQUIRE(std::holds_alternative<pakt::source_group>(src.v));
  CHECK(std::get<pakt::source_group>(src.v).entries.empty());
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.src reports malformed entries without aborting") {
  pakt::test::log_capture log;
  lua.run(R"(
    pakt.src({ src = "o/a", version = 3 })
    pakt.src({ src = "o/b", setup = "not a function" })
    pakt.src({ foo = "bar" })
    pakt.src(42)
    pakt.src("o/ok")
  )");
  REQUIRE(sess.queued().size() == 1);
  CHECK(log.contains("version must be a string"));
  CHECK(log.contains("setup must be a function"));
}

TEST_CASE_FIXTURE(lua_fixture, "setup functions run through the scheduler") {
  lua.run(R"(
    ran = {}
    pakt.src({ src = "o/lib", setup = function() table.insert(ran, "lib") end })
    pakt.src({
      src = "o/app",
      deps = { { src = "o/lib" } },
      setup = function() table.insert(ran, "app") end,
    })
  )");

  pakt::test::fake_installer inst;
  sess.install(inst);

  sol::table ran = lua.state()["ran"];
  REQUIRE(ran.size() == 2);
  CHECK(ran.get<std::string>(1) == "lib");
  CHECK(ran.get<std::string>(2) == "app");
}

TEST_CASE_FIXTURE(lua_fixture, "a failing Lua setup is reported and isolated") {
  lua.run(R"(
    pakt.src({ src = "o/bad", setup = function() error("kaboom") end })
    pakt.src({ src = "o/good", setup = function() good = true end })
  )");

  pakt::test::log_capture log;
  pakt::test::fake_installer inst;
  auto const summary{ sess.install(inst) };
  CHECK(summary.setup_failures == 1);
  CHECK(lua.state()["good"].get<bool>());
  CHECK(log.contains("kaboom"));
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.emit fires events that release gated setups") {
  sess.cfg().debounce = 0ms;
  lua.run(R"(
    pakt.src({ src = "o/lazy", event = "User", setup = function() lazy_ran = true end })
  )");

  pakt::test::fake_installer inst;
  sess.install(inst);
  CHECK_FALSE(lua.state()["lazy_ran"].get_or(false));

  lua.run(R"(pakt.emit("User", "init.lua"))");
  sess.events().drain();
  CHECK(lua.state()["lazy_ran"].get_or(false));
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.configure sets session options") {
  lua.run(R"(
    pakt.configure({
      parallel = 8,
      default_host = "https://codeberg.org/",
      clear_queue = false,
      enter_event = "VimEnter",
      debounce_ms = 25,
      fallback_branches = { "trunk" },
    })
  )");
  auto const &cfg{ sess.cfg() };
  CHECK(cfg.parallel_limit == 8);
  CHECK(cfg.default_host == "https://codeberg.org/");
  CHECK_FALSE(cfg.clear_queue_after_install);
  CHECK(cfg.enter_event == "VimEnter");
  CHECK(cfg.debounce == 25ms);
  CHECK(cfg.fallback_branches == std::vector<std::string>{ "trunk" });
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.configure rejects bad values") {
  pakt::test::log_capture log;
  lua.run(R"(pakt.configure({ parallel = 0 }))");
  lua.run(R"(pakt.configure({ clear_queue = "yes" }))");
  CHECK(sess.cfg().parallel_limit == 4);
  CHECK(sess.cfg().clear_queue_after_install);
  CHECK(log.contains("parallel must be positive"));
  CHECK(log.contains("clear_queue must be a boolean"));
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.require registers a single module file") {
  root.write("lua/plugins/editor.lua", R"(return { src = "o/editor" })");
  lua.run(R"(assert(pakt.require("plugins.editor") == 1))");
  REQUIRE(sess.queued().size() == 1);
  CHECK(as_single(sess.queued()[0]).src == "o/editor");
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.require loads every module in a directory in order") {
  root.write("lua/plugins/b.lua", R"(return { src = "o/b" })");
  root.write("lua/plugins/a.lua", R"(return { src = "o/a" })");
  root.write("lua/plugins/c.lua", R"(return { "o/c1", "o/c2" })");
  root.write("lua/plugins/notes.txt", "not lua");
  root.write("lua/plugins/nothing.lua", "local x = 1");

  lua.run(R"(pakt.require("plugins"))");
  auto const p{ plan() };
  REQUIRE(p.plugins.size() == 4);
  CHECK(p.plugins[0].source == "https://github.com/o/a");
  CHECK(p.plugins[1].source == "https://github.com/o/b");
  CHECK(p.plugins[2].source == "https://github.com/o/c1");
}

TEST_CASE_FIXTURE(lua_fixture, "pakt.require reports missing paths and broken modules") {
  root.write("lua/broken.lua", "return {");
  pakt::test::log_capture log;
  lua.run(R"(
    assert(pakt.require("does.not.exist") == 0)
    assert(pakt.require("broken") == 0)
  )");
  CHECK(sess.queued().empty());
  CHECK(log.contains("module path not found"));
  CHECK(log.contains("Failed to load module"));
}

TEST_CASE_FIXTURE(lua_fixture, "modules can require helpers from the lua directory") {
  root.write("lua/helpers/init.lua", R"(return { host = "o" })");
  root.write("lua/plugins/uses.lua",
             R"(local h = require("helpers"); return { src = h.host .. "/uses" })");
  lua.run(R"(pakt.require("plugins.uses"))");
  REQUIRE(sess.queued().size() == 1);
  CHECK(as_single(sess.queued()[0]).src == "o/uses");
}

TEST_CASE_FIXTURE(lua_fixture, "load runs init.lua from the config root") {
  root.write("init.lua", R"(pakt.src("o/from-init"))");
  lua.load();
  CHECK(sess.queued().size() == 1);
}

TEST_CASE_FIXTURE(lua_fixture, "load fails for a missing or broken init.lua") {
  CHECK_THROWS_AS(lua.load(), std::runtime_error);
  root.write("init.lua", "this is not lua");
  CHECK_THROWS_AS(lua.load(), std::runtime_error);
}

TEST_CASE("lua_config without a bound session refuses registrations") {
  pakt::test::temp_dir root;
  root.write("lua/x.lua", R"(return { src = "o/x" })");
  pakt::lua_config lua{ root.path };
  CHECK_THROWS_AS(lua.require_modules("x"), std::logic_error);
}
