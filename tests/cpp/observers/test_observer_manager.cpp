#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <relay/runtime/event_loop.h>

#include "observer_test_app.h"

namespace relay::test {
    namespace {
        struct Pressed : Event {
        };

        struct Released : Event {
        };

        struct Greeter {
            std::string greeting;

            Value greet(const Arguments &args) { return fmt::format("{} {}", greeting, args[0]); }
        };
    } // namespace

    TEST_CASE("ObserverManager - callback chain", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong", "other"}};

        app.when(Modified("ping", "value"), Select("other", "value"), Update("pong", "value"))(
            [](const Arguments &args) { return Value{fmt::format("ping {} with {}", args[0], args[1])}; });
        app.when(Modified("pong", "value"), Update("other", "value"))(
            [](const Arguments &args) { return Value{fmt::format("other value: {}", args[0])}; });
        app.register_components();

        REQUIRE(app.value("ping").is_null());
        REQUIRE(app.value("pong").is_null());
        REQUIRE(app.value("other").is_null());

        app.component("ping").set("value", "test1");
        CHECK(app.value("ping") == Value{"test1"});
        CHECK(app.value("pong") == Value{"ping test1 with null"});
        CHECK(app.value("other") == Value{"other value: ping test1 with null"});

        app.component("ping").set("value", "test2");
        CHECK(app.value("pong") == Value{"ping test2 with other value: ping test1 with null"});
        CHECK(app.value("other") == Value{"other value: ping test2 with other value: ping test1 with null"});
        CHECK(app.log().messages.empty());
    }

    TEST_CASE("ObserverManager - asynchronous callbacks complete on the event loop", "[observers][manager]") {
        ObserverRegistry shared;
        EventLoop loop;
        TestApp app{shared, {"ping", "pong"}};

        app.when(Modified("ping", "value"), Update("pong", "value"))([&loop](const Arguments &args) {
            return loop.defer([ping = args[0]] { return Value{fmt::format("pong {}", ping)}; });
        });
        app.register_components();

        app.component("ping").set("value", "a");
        REQUIRE(app.value("pong").is_null());
        REQUIRE(loop.pending() == 1);

        loop.run_until_idle();
        REQUIRE(app.value("pong") == Value{"pong a"});
    }

    TEST_CASE("ObserverManager - results are zipped with the updates, skipping no_update", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "a", "b", "c"}};

        app.when(Modified("ping", "value"), Update("a", "value"), Update("b", "value"), Update("c", "value"))(
            [](const Arguments &) { return Value::list("x", no_update, "z"); });
        app.register_components();

        app.component("ping").set("value", 1);
        CHECK(app.value("a") == Value{"x"});
        CHECK(app.value("b").is_null());
        CHECK(app.value("c") == Value{"z"});
        REQUIRE(app.applied.size() == 2);
        CHECK(std::get<1>(app.applied[0]) == "a");
        CHECK(std::get<1>(app.applied[1]) == "c");
    }

    TEST_CASE("ObserverManager - missing update target skips the dispatch silently", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "other"}};
        int calls{0};

        app.when(Modified("ping", "value"), Select("other", "value"), Update("gone", "value"))(
            [&calls](const Arguments &) {
                ++calls;
                return Value{"never"};
            });
        app.register_components();

        app.component("ping").set("value", "x");
        CHECK(calls == 0);
        CHECK(app.applied.empty());
        CHECK(app.log().messages.empty());

        app.add_component("gone");
        app.component("ping").set("value", "y");
        CHECK(calls == 1);
        CHECK(app.value("gone") == Value{"never"});
    }

    TEST_CASE("ObserverManager - a select on the trigger sees the previous value", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};
        Arguments received;

        app.component("ping").set("value", "A");
        app.when(Modified("ping", "value"), Select("ping", "value"), Update("pong", "value"))(
            [&received](const Arguments &args) {
                received = args;
                return Value{no_update};
            });
        app.register_components();

        app.component("ping").set("value", "B");
        REQUIRE(received == Arguments{Value{"B"}, Value{"A"}});
        CHECK(app.applied.empty());
    }

    TEST_CASE("ObserverManager - shared observers are generated before local ones", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};
        std::vector<std::string> calls;

        app.when(Modified("ping", "value"), Update("pong", "value"))([&calls](const Arguments &) {
            calls.emplace_back("local");
            return Value{"local"};
        });
        when(shared, Modified("ping", "value"), Update("pong", "value"))([&calls](const Arguments &) {
            calls.emplace_back("shared");
            return Value{"shared"};
        });

        auto handlers = app.generate_handlers("ping", "value");
        REQUIRE(handlers.size() == 2);

        static_cast<void>(handlers[0](Value{}, Value{"x"}));
        static_cast<void>(handlers[1](Value{}, Value{"x"}));
        REQUIRE(calls == std::vector<std::string>{"shared", "local"});
        CHECK(app.value("pong") == Value{"local"});

        TestApp other{shared, {"ping", "pong"}};
        CHECK(other.generate_handlers("ping", "value").size() == 1);
    }

    TEST_CASE("ObserverManager - failures are isolated to the observer that raised them", "[observers][manager]") {
        ObserverRegistry shared;
        EventLoop loop;
        TestApp app{shared, {"a", "b", "c", "out_a", "out_b", "out_c", "handled"}};

        app.when(Modified("a", "value"), Update("out_a", "value"))([&loop](const Arguments &) {
            return loop.defer([]() -> Value { throw std::invalid_argument("bad a"); });
        });
        app.when(Modified("b", "value"), Update("out_b", "value"))([&loop](const Arguments &) {
            return loop.defer([]() -> Value { throw std::out_of_range("bad b"); });
        });
        app.when(Modified("c", "value"), Update("out_c", "value"))([&loop](const Arguments &) {
            return loop.defer([] { return Value{"ok"}; });
        });
        app.when(Raised(typeid(std::invalid_argument)), Update("handled", "value"))([](const Arguments &args) {
            auto error = args[0].as_object<CallbackError>();
            return Value{fmt::format("handled {}", error->message())};
        });
        app.register_components();

        app.component("a").set("value", 1);
        app.component("b").set("value", 2);
        app.component("c").set("value", 3);
        loop.run_until_idle();

        CHECK(app.value("out_a").is_null());
        CHECK(app.value("out_b").is_null());
        CHECK(app.value("out_c") == Value{"ok"});
        CHECK(app.value("handled") == Value{"handled bad a"});
        REQUIRE(app.log().count(LogLevel::ERROR) == 2);
        CHECK_THAT(app.log().messages[0].second, Catch::Matchers::ContainsSubstring("std::invalid_argument bad a"));
        CHECK_THAT(app.log().messages[1].second, Catch::Matchers::ContainsSubstring("std::out_of_range bad b"));
    }

    TEST_CASE("ObserverManager - an error handler that fails is not dispatched again", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};
        int handler_calls{0};

        app.when(Modified("ping", "value"), Update("pong", "value"))([](const Arguments &) -> Value {
            throw std::runtime_error("boom");
        });
        app.when(Raised(typeid(std::runtime_error)))([&handler_calls](const Arguments &) -> Value {
            ++handler_calls;
            throw std::runtime_error("again");
        });
        app.register_components();

        app.component("ping").set("value", 1);
        CHECK(handler_calls == 1);
        CHECK(app.log().count(LogLevel::ERROR) == 2);
    }

    TEST_CASE("ObserverManager - raised dispatch can be disabled", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}, ObserverManagerConfig{.dispatch_raised = false}};
        int handler_calls{0};

        app.when(Modified("ping", "value"), Update("pong", "value"))([](const Arguments &) -> Value {
            throw std::runtime_error("boom");
        });
        app.when(Raised(typeid(std::runtime_error)))([&handler_calls](const Arguments &) { ++handler_calls; });
        app.register_components();

        app.component("ping").set("value", 1);
        CHECK(handler_calls == 0);
        CHECK(app.log().count(LogLevel::ERROR) == 1);
    }

    TEST_CASE("ObserverManager - a callback without updates runs once per change", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping"}};
        int calls{0};

        app.when(Modified("ping", "value"))([&calls](const Arguments &) { ++calls; });
        app.register_components();

        REQUIRE(calls == 0);
        app.component("ping").set("value", "test1");
        CHECK(calls == 1);
        app.component("ping").set("value", "test1");
        CHECK(calls == 1);
        CHECK(app.applied.empty());
    }

    TEST_CASE("ObserverManager - PreventUpdate skips the dispatch silently", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};

        app.when(Modified("ping", "value"), Update("pong", "value"))([](const Arguments &) -> Value {
            throw PreventUpdate{};
        });
        app.when(Raised(typeid(PreventUpdate)), Update("pong", "value"))([](const Arguments &) {
            return Value{"raised"};
        });
        app.register_components();

        app.component("ping").set("value", 1);
        CHECK(app.value("pong").is_null());
        CHECK(app.log().messages.empty());
    }

    TEST_CASE("ObserverManager - argument resolution failures", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong", "other"}};
        int calls{0};
        auto callback = [&calls](const Arguments &) {
            ++calls;
            return Value{"called"};
        };

        SECTION("unknown property is reported") {
            app.when(Modified("ping", "value"), Select("other", "missing"), Update("pong", "value"))(callback);
            app.register_components();
            app.component("ping").set("value", 1);

            CHECK(calls == 0);
            REQUIRE(app.log().count(LogLevel::ERROR) == 1);
            CHECK_THAT(app.log().messages[0].second, Catch::Matchers::ContainsSubstring("relay::UnknownProperty"));
        }

        SECTION("unavailable component is skipped silently") {
            app.when(Modified("ping", "value"), Select("elsewhere", "value"), Update("pong", "value"))(callback);
            app.register_components();
            app.component("ping").set("value", 1);

            CHECK(calls == 0);
            CHECK(app.log().messages.empty());
        }
    }

    TEST_CASE("ObserverManager - fatal errors propagate", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};
        EventLoop loop;

        SECTION("from a synchronous callback") {
            app.when(Modified("ping", "value"), Update("pong", "value"))([](const Arguments &) -> Value {
                throw FatalError("terminate");
            });
            app.register_components();

            REQUIRE_THROWS_AS(app.component("ping").set("value", 1), FatalError);
        }

        SECTION("from an asynchronous callback") {
            app.when(Modified("ping", "value"), Update("pong", "value"))([&loop](const Arguments &) {
                return loop.defer([]() -> Value { throw FatalError("terminate"); });
            });
            app.register_components();

            app.component("ping").set("value", 1);
            REQUIRE_THROWS_AS(loop.run_until_idle(), FatalError);
            CHECK_FALSE(loop.running());
        }

        CHECK(app.log().messages.empty());
        CHECK(app.value("pong").is_null());
    }

    TEST_CASE("ObserverManager - published events", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"button", "label", "ping"}};
        Arguments received;

        app.when(Published("button", typeid(Pressed)), Modified("ping", "value"), Update("label", "value"))(
            [&received](const Arguments &args) {
                received = args;
                return Value{args[0].is_null() ? "modified" : "pressed"};
            });
        app.register_components();

        REQUIRE(app.observes("button", type_name(typeid(Pressed))));

        auto done = app.publish("button", std::make_shared<Pressed>());
        REQUIRE(done.is_ready());
        CHECK(app.value("label") == Value{"pressed"});
        REQUIRE(received.size() == 2);
        CHECK(received[0].as_object<Pressed>() != nullptr);

        app.component("ping").set("value", "x");
        CHECK(app.value("label") == Value{"modified"});
        CHECK(received == Arguments{Value{}, Value{"x"}});

        app.component("label").set("value", "reset");
        static_cast<void>(app.publish("button", std::make_shared<Released>()));
        static_cast<void>(app.publish("label", std::make_shared<Pressed>()));
        CHECK(app.value("label") == Value{"reset"});

        REQUIRE_THROWS_AS(app.publish("button", nullptr), std::invalid_argument);
    }

    TEST_CASE("ObserverManager - apply failure policies", "[observers][manager]") {
        ObserverRegistry shared;
        const std::vector<std::string> ids{"ping", "a", "b", "c"};
        auto declare = [](TestApp &app) {
            app.when(Modified("ping", "value"), Update("a", "value"), Update("b", "value"), Update("c", "value"))(
                [](const Arguments &args) { return Value::list(args[0], args[0], args[0]); });
            app.failing_targets.insert("b");
            app.register_components();
        };

        SECTION("abort remaining") {
            TestApp app{shared, ids};
            declare(app);
            app.component("ping").set("value", 7);

            CHECK(app.value("a") == Value{7});
            CHECK(app.value("b").is_null());
            CHECK(app.value("c").is_null());
            CHECK(app.log().count(LogLevel::ERROR) == 1);
        }

        SECTION("continue remaining") {
            TestApp app{shared, ids, ObserverManagerConfig{.apply_failure_policy = ApplyFailurePolicy::CONTINUE_REMAINING}};
            declare(app);
            app.component("ping").set("value", 7);

            CHECK(app.value("a") == Value{7});
            CHECK(app.value("b").is_null());
            CHECK(app.value("c") == Value{7});
            CHECK(app.log().count(LogLevel::ERROR) == 1);
        }
    }

    TEST_CASE("ObserverManager - pending updates are applied one after another", "[observers][manager]") {
        ObserverRegistry shared;
        EventLoop loop;
        const std::vector<std::string> ids{"ping", "a", "b", "c"};
        auto dispatch_ping = [&loop](TestApp &app) {
            app.apply_loop = &loop;
            app.failing_targets.insert("b");
            app.when(Modified("ping", "value"), Update("a", "value"), Update("b", "value"), Update("c", "value"))(
                [](const Arguments &args) { return Value::list(args[0], args[0], args[0]); });
            return ObserverManager::combine_handlers(app.generate_handlers("ping", "value"))(Value{}, Value{7});
        };

        SECTION("abort remaining") {
            TestApp app{shared, ids};
            auto done = dispatch_ping(app);
            REQUIRE_FALSE(done.is_ready());
            CHECK(app.applied.empty());

            REQUIRE(loop.run_once());
            CHECK(app.value("a") == Value{7});
            REQUIRE_FALSE(done.is_ready());

            REQUIRE(loop.run_once());
            REQUIRE(done.is_ready());
            CHECK_FALSE(done.has_error());
            CHECK(loop.pending() == 0);
            CHECK(app.value("b").is_null());
            CHECK(app.value("c").is_null());
            CHECK(app.applied.size() == 1);
            CHECK(app.log().count(LogLevel::ERROR) == 1);
        }

        SECTION("continue remaining") {
            TestApp app{shared, ids, ObserverManagerConfig{.apply_failure_policy = ApplyFailurePolicy::CONTINUE_REMAINING}};
            auto done = dispatch_ping(app);

            REQUIRE(loop.run_once());
            REQUIRE(loop.run_once());
            CHECK(app.value("b").is_null());
            CHECK(app.log().count(LogLevel::ERROR) == 1);
            REQUIRE_FALSE(done.is_ready());
            CHECK(app.value("c").is_null());

            REQUIRE(loop.run_once());
            REQUIRE(done.is_ready());
            CHECK_FALSE(done.has_error());
            CHECK(app.value("a") == Value{7});
            CHECK(app.value("c") == Value{7});
            REQUIRE(app.applied.size() == 2);
            CHECK(std::get<1>(app.applied[1]) == "c");
        }
    }

    TEST_CASE("ObserverManager - method observers bound to an instance", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};

        app.when(Modified("ping", "value"), Update("pong", "value"))(&Greeter::greet);
        app.register_components();

        app.component("ping").set("value", "nobody");
        CHECK(app.value("pong").is_null());
        REQUIRE(app.log().count(LogLevel::ERROR) == 1);
        CHECK_THAT(app.log().messages[0].second, Catch::Matchers::ContainsSubstring("has not been bound"));

        auto greeter = std::make_shared<Greeter>(Greeter{"hello"});
        app.attach_to_instance(greeter);
        app.component("ping").set("value", "bob");
        CHECK(app.value("pong") == Value{"hello bob"});

        std::weak_ptr<Greeter> observed{greeter};
        greeter.reset();
        REQUIRE(observed.expired());

        app.component("ping").set("value", "alice");
        CHECK(app.value("pong") == Value{"hello bob"});
        CHECK(app.log().count(LogLevel::ERROR) == 1);

        auto replacement = std::make_shared<Greeter>(Greeter{"hi"});
        app.attach_to_instance(replacement);
        app.component("ping").set("value", "carol");
        CHECK(app.value("pong") == Value{"hi carol"});
    }

    TEST_CASE("ObserverManager - external observers", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};

        auto registration = app.when(RegisterOptions{.external = true}, Modified("ping", "value"),
                                     Update("pong", "value"));
        registration([](const Arguments &args) { return Value{fmt::format("remote {}", args[0])}; });
        app.register_components();

        app.component("ping").set("value", 1);
        CHECK(app.value("pong") == Value{"remote 1"});
        CHECK(app.log().count(LogLevel::WARNING) == 1);

        const auto &observer_id = registration.observers().front()->observer_id();
        auto result = app.send_callback(observer_id, {Value{2}});
        REQUIRE(result.is_ready());
        REQUIRE(result.get().has_value());
        CHECK(result.get()->at("pong").at("value") == Value{"remote 2"});

        REQUIRE_THROWS_AS(app.send_callback("unknown...id", {}), UnknownObserver);
    }

    TEST_CASE("ObserverManager - identical external observers each run their own callback", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};
        std::vector<std::string> calls;

        auto remote = when(shared, RegisterOptions{.external = true}, Modified("ping", "value"), Update("pong", "value"));
        remote([&calls](const Arguments &) {
            calls.emplace_back("shared");
            return Value{"shared"};
        });
        app.when(Modified("ping", "value"), Update("pong", "value"))([&calls](const Arguments &) {
            calls.emplace_back("local");
            return Value{"local"};
        });
        app.register_components();

        app.component("ping").set("value", 1);
        CHECK(calls == std::vector<std::string>{"shared", "local"});
        CHECK(app.value("pong") == Value{"local"});

        // Called directly, the shared registration is found first
        calls.clear();
        auto result = app.send_callback(remote.observers().front()->observer_id(), {Value{2}});
        CHECK(calls == std::vector<std::string>{"shared"});
        CHECK(result.get()->at("pong").at("value") == Value{"shared"});
    }

    TEST_CASE("ObserverManager - connect only wires observed fields", "[observers][manager]") {
        ObserverRegistry shared;
        TestApp app{shared, {"ping", "pong"}};
        app.add_component("multi", FieldDeclarations{{"first", ObservedValue{}}, {"second", ObservedValue{}}});

        app.when(Modified("multi", "second"), Update("pong", "value"))([](const Arguments &args) { return args[0]; });

        CHECK(app.observes("multi"));
        CHECK_FALSE(app.observes("ping"));
        CHECK(connect(app, app.component("multi")) == 1);
        CHECK(connect(app, app.component("ping")) == 0);

        app.component("multi").set("first", 1);
        CHECK(app.value("pong").is_null());
        app.component("multi").set("second", 2);
        CHECK(app.value("pong") == Value{2});
    }
} // namespace relay::test
