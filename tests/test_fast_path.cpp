/**
 * Fast-path intent matching and dispatch.
 * Asserts:
 * - Anchored open/close patterns with an optional "the".
 * - Long or compound app names fall through to the remote agent.
 * - Only a successful OS action produces a note.
 * - App names keep non-ASCII letters and lose quotes and dashes.
 *
 * Run from build dir: ./test_fast_path
 * Uses an in-process AppController; nothing is launched.
 */

#include "action_dispatcher.h"
#include "plugins/app_intent_plugin.h"
#include "utils.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voice_os;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

class FakeApps : public AppController {
public:
    VoidResult launch_app(const std::string& name) override {
        launched.push_back(name);
        return succeed ? VoidResult::ok_result() : VoidResult::failure("exit status 1");
    }

    VoidResult quit_app(const std::string& name) override {
        quit.push_back(name);
        return succeed ? VoidResult::ok_result() : VoidResult::failure("exit status 1");
    }

    bool succeed = true;
    std::vector<std::string> launched;
    std::vector<std::string> quit;
};

class ThrowingPlugin : public ActionPlugin {
public:
    std::string name() const override { return "throwing"; }
    std::optional<FastPathOutcome> try_handle(const std::string&) override {
        throw std::runtime_error("boom");
    }
    int priority() const override { return 1; }
};

} // anonymous namespace

int main() {
    auto apps = std::make_shared<FakeApps>();
    AppIntentPlugin plugin(apps, 3, {"and", "then"});

    // --- parse ---
    auto safari = plugin.parse("open safari");
    ASSERT(safari && safari->kind == AppIntentPlugin::Intent::Kind::Open && safari->app == "safari");

    auto calculator = plugin.parse("open the calculator");
    ASSERT(calculator && calculator->app == "calculator");

    auto finder = plugin.parse("close finder");
    ASSERT(finder && finder->kind == AppIntentPlugin::Intent::Kind::Close && finder->app == "finder");

    ASSERT(!plugin.parse("open settings and close mail"));
    ASSERT(!plugin.parse("open mail then reply to bob"));
    ASSERT(!plugin.parse("open my very long application name"));   // 5 tokens
    ASSERT(plugin.parse("open visual studio code"));               // 3 tokens

    auto punctuated = plugin.parse("launch firefox.");
    ASSERT(punctuated && punctuated->app == "firefox");

    auto quit_the = plugin.parse("quit the music app!");
    ASSERT(quit_the && quit_the->kind == AppIntentPlugin::Intent::Kind::Close && quit_the->app == "music app");

    for (const char* verb : {"exit", "terminate", "kill"}) {
        auto intent = plugin.parse(std::string(verb) + " slack");
        ASSERT(intent && intent->kind == AppIntentPlugin::Intent::Kind::Close);
    }
    ASSERT(plugin.parse("start spotify"));

    // Anchored: the verb must come first
    ASSERT(!plugin.parse("please open safari"));
    ASSERT(!plugin.parse("what does open source mean"));
    ASSERT(!plugin.parse("open"));
    ASSERT(!plugin.parse("open ..."));   // nothing left after punctuation
    ASSERT(!plugin.parse("opensafari"));

    // "the" is only dropped as a whole word
    auto theater = plugin.parse("open theater");
    ASSERT(theater && theater->app == "theater");

    // Commands arrive normalized
    ASSERT(plugin.parse(utils::normalize_command("  ...Open Safari")));

    // --- try_handle ---
    auto outcome = plugin.try_handle("open safari");
    ASSERT(outcome && outcome->note);
    ASSERT(outcome && outcome->note && outcome->note->find("safari") != std::string::npos);
    ASSERT(apps->launched.size() == 1 && apps->launched[0] == "safari");

    auto closed = plugin.try_handle("close finder");
    ASSERT(closed && closed->note);
    ASSERT(apps->quit.size() == 1 && apps->quit[0] == "finder");

    // Miss: controller untouched
    ASSERT(!plugin.try_handle("what is the weather"));
    ASSERT(apps->launched.size() == 1);

    // OS failure is absorbed: no outcome
    apps->succeed = false;
    ASSERT(!plugin.try_handle("open safari"));
    ASSERT(apps->launched.size() == 2);
    apps->succeed = true;

    // Non-ASCII names survive the punctuation strip intact
    auto accented = plugin.parse(utils::normalize_command("Open Café Móvil"));
    ASSERT(accented && accented->app == "café móvil");
    ASSERT(plugin.try_handle(utils::normalize_command("Close Müller's Notes!")));
    ASSERT(!apps->quit.empty() && apps->quit.back() == "müllers notes");
    ASSERT(plugin.try_handle("open café"));
    ASSERT(apps->launched.back() == "café");

    // Quotes and option dashes never reach the OS command
    auto quoted = plugin.parse("quit \"mail\" -9");
    ASSERT(quoted && quoted->app == "mail 9");

    // --- configurable guard ---
    AppIntentPlugin strict(apps, 1, {"plus"});
    ASSERT(!strict.parse("open visual studio"));
    ASSERT(strict.parse("open code"));
    ASSERT(!strict.parse("open plus"));
    AppIntentPlugin lenient(apps, 5, {});
    ASSERT(lenient.parse("open settings and mail"));

    // --- dispatcher ---
    ActionDispatcher dispatcher;
    ASSERT(!dispatcher.dispatch("open safari"));   // no plugins
    dispatcher.register_plugin(std::make_shared<AppIntentPlugin>(apps, 3, std::vector<std::string>{"and", "then"}));
    dispatcher.register_plugin(std::make_shared<ThrowingPlugin>());
    ASSERT(dispatcher.size() == 2);
    ASSERT(dispatcher.plugins().front()->name() == "throwing");   // lower priority value first

    // A throwing plugin is skipped
    auto dispatched = dispatcher.dispatch("open safari");
    ASSERT(dispatched && dispatched->note);
    ASSERT(!dispatcher.dispatch("tell me a joke"));

    bool threw = false;
    try {
        AppIntentPlugin missing(nullptr, 3, {});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All fast-path tests passed.\n";
    return 0;
}
