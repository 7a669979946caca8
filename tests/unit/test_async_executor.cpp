// test_async_executor.cpp - streamed exec on a worker thread
// threads plus callbacks, the place where bugs like to hide

#include "../common/test_helpers.hpp"
#include "fastssh/async_executor.hpp"

#include <doctest/doctest.h>

#include <mutex>
#include <stdexcept>
#include <string>

using namespace fastssh;
using namespace fastssh::testing;
using namespace std::chrono_literals;

namespace
{

    // thread-safe accumulator for callback output
    class collector
    {
    public:
        [[nodiscard]] auto callback() -> output_callback
        {
            return [this](std::span<std::uint8_t const> const chunk)
            {
                std::lock_guard lock{mutex_};
                text_.append(as_string_view(chunk));
                ++chunks_;
            };
        }

        [[nodiscard]] auto text() -> std::string
        {
            std::lock_guard lock{mutex_};
            return text_;
        }

        [[nodiscard]] auto chunks() -> int
        {
            std::lock_guard lock{mutex_};
            return chunks_;
        }

    private:
        std::mutex mutex_;
        std::string text_;
        int chunks_{0};
    };

    struct connected_link
    {
        std::shared_ptr<fake_remote> remote{std::make_shared<fake_remote>()};
        fake_transport link{remote};

        connected_link() { REQUIRE(link.connect(test_credentials(), fast_config()).has_value()); }

        auto script(std::string const &command, scripted_command script) -> void
        {
            std::lock_guard lock{remote->mutex};
            remote->commands[command] = std::move(script);
        }
    };

} // anonymous namespace

TEST_SUITE("async_phase")
{
    TEST_CASE("names")
    {
        CHECK(to_string(async_phase::starting) == "starting");
        CHECK(to_string(async_phase::streaming) == "streaming");
        CHECK(to_string(async_phase::finished) == "finished");
    }

    TEST_CASE("default handle is invalid and finished")
    {
        async_execution const handle{};
        CHECK_FALSE(handle.valid());
        CHECK(handle.done());
        CHECK(handle.wait_for(0ms));

        auto const outcome = handle.wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error() == error::channel_closed);

        handle.cancel();
    }
}

TEST_SUITE("async_executor")
{
    TEST_CASE("streams every chunk and reports the exit status")
    {
        connected_link fixture;
        fixture.script("progress", scripted_command{.output = {{output_stream::out, "10%\n"},
                                                               {output_stream::out, "50%\n"},
                                                               {output_stream::out, "100%\n"}},
                                                    .exit_code = 0});

        collector out;
        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("progress", out.callback());
        REQUIRE(task.has_value());

        auto const handle = (*task)->handle();
        REQUIRE(handle.valid());
        REQUIRE(handle.wait_for(5s));

        auto const status = handle.wait();
        REQUIRE(status.has_value());
        CHECK(*status == 0);
        CHECK(out.text() == "10%\n50%\n100%\n");
        CHECK(out.chunks() == 3);
        CHECK(handle.done());
        CHECK((*task)->finished());
    }

    TEST_CASE("stderr goes to its own callback when given")
    {
        connected_link fixture;
        fixture.script("noisy", scripted_command{.output = {{output_stream::out, "data\n"},
                                                            {output_stream::err, "warning\n"}},
                                                 .exit_code = 3});

        collector out;
        collector err;
        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("noisy", out.callback(), err.callback());
        REQUIRE(task.has_value());

        auto const status = (*task)->handle().wait();
        REQUIRE(status.has_value());
        CHECK(*status == 3);
        CHECK(out.text() == "data\n");
        CHECK(err.text() == "warning\n");
    }

    TEST_CASE("stderr is discarded without a callback")
    {
        connected_link fixture;
        fixture.script("noisy", scripted_command{.output = {{output_stream::err, "warning\n"},
                                                            {output_stream::out, "data\n"}},
                                                 .exit_code = 0});

        collector out;
        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("noisy", out.callback());
        REQUIRE(task.has_value());

        REQUIRE((*task)->handle().wait().has_value());
        CHECK(out.text() == "data\n");
    }

    TEST_CASE("start returns while the command is still running")
    {
        connected_link fixture;
        auto gate = std::make_shared<std::atomic<bool>>(false);
        fixture.script("tail -f log", scripted_command{.output = {{output_stream::out, "line\n"}},
                                                       .exit_code = 0,
                                                       .gate = gate});

        collector out;
        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("tail -f log", out.callback());
        REQUIRE(task.has_value());

        auto const handle = (*task)->handle();
        CHECK(eventually([&] { return handle.phase() == async_phase::streaming; }));
        CHECK_FALSE(handle.done());
        CHECK(out.text().empty());

        gate->store(true);
        REQUIRE(handle.wait_for(5s));
        CHECK(out.text() == "line\n");
    }

    TEST_CASE("cancel stops a running stream")
    {
        connected_link fixture;
        auto gate = std::make_shared<std::atomic<bool>>(false);
        fixture.script("forever", scripted_command{.output = {}, .exit_code = 0, .gate = gate});

        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("forever", [](std::span<std::uint8_t const>) {});
        REQUIRE(task.has_value());

        auto const handle = (*task)->handle();
        handle.cancel();

        REQUIRE(handle.wait_for(5s));
        auto const outcome = handle.wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error() == error::channel_closed);
        CHECK(fixture.remote->closed_channels == 1);
    }

    TEST_CASE("stop joins the worker and the handle outlives the task")
    {
        connected_link fixture;
        auto gate = std::make_shared<std::atomic<bool>>(false);
        fixture.script("forever", scripted_command{.output = {}, .exit_code = 0, .gate = gate});

        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("forever", [](std::span<std::uint8_t const>) {});
        REQUIRE(task.has_value());

        auto const handle = (*task)->handle();
        task->reset();

        CHECK(handle.done());
        CHECK(handle.wait().error() == error::channel_closed);
    }

    TEST_CASE("callback may stop its own task")
    {
        connected_link fixture;
        auto gate = std::make_shared<std::atomic<bool>>(false);
        fixture.script("chatty", scripted_command{.output = {{output_stream::out, "a"}, {output_stream::out, "b"}},
                                                  .exit_code = 0,
                                                  .gate = gate});

        async_executor executor{fixture.link, fast_config()};
        std::unique_ptr<async_task> *self = nullptr;
        int seen = 0;
        auto task = executor.start("chatty",
                                   [&](std::span<std::uint8_t const>)
                                   {
                                       ++seen;
                                       (*self)->stop();
                                   });
        REQUIRE(task.has_value());
        self = &*task;
        gate->store(true);

        auto const handle = (*task)->handle();
        REQUIRE(handle.wait_for(5s));
        CHECK(seen == 1);
    }

    TEST_CASE("throwing callback ends the stream with an error")
    {
        connected_link fixture;
        fixture.script("chatty", scripted_command{.output = {{output_stream::out, "a"}, {output_stream::out, "b"}},
                                                  .exit_code = 0});
        log_capture logs;

        int calls = 0;
        async_executor executor{fixture.link, fast_config()};
        auto task = executor.start("chatty",
                                   [&](std::span<std::uint8_t const>)
                                   {
                                       ++calls;
                                       throw std::runtime_error("callback failed");
                                   });
        REQUIRE(task.has_value());

        auto const handle = (*task)->handle();
        REQUIRE(handle.wait_for(5s));
        auto const outcome = handle.wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error() == error::callback_failed);
        CHECK(calls == 1);
        CHECK(fixture.remote->closed_channels == 1);
        CHECK(logs.contains("callback failed"));
    }

    TEST_CASE("empty command is rejected")
    {
        connected_link fixture;
        async_executor executor{fixture.link, fast_config()};

        auto const task = executor.start("", [](std::span<std::uint8_t const>) {});
        REQUIRE_FALSE(task.has_value());
        CHECK(task.error() == error::invalid_argument);
    }

    TEST_CASE("closed transport refuses to start")
    {
        connected_link fixture;
        fixture.link.disconnect();
        async_executor executor{fixture.link, fast_config()};

        auto const task = executor.start("echo hi", [](std::span<std::uint8_t const>) {});
        REQUIRE_FALSE(task.has_value());
        CHECK(task.error() == error::connection_closed);
    }
}
