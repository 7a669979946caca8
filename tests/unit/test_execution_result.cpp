// test_execution_result.cpp - accessors and stdin flush on captured results

#include "../common/test_helpers.hpp"
#include "fastssh/execution_result.hpp"

#include <doctest/doctest.h>

using namespace fastssh;
using namespace fastssh::testing;

namespace
{

    // an open channel running `cat`, its stdin still accepting input
    struct cat_channel
    {
        std::shared_ptr<fake_remote> remote{std::make_shared<fake_remote>()};
        fake_transport link{remote};
        std::shared_ptr<exec_channel> channel;

        cat_channel()
        {
            REQUIRE(link.connect(test_credentials(), fast_config()).has_value());
            auto opened = link.open_exec("cat", {});
            REQUIRE(opened.has_value());
            channel = *opened;
        }
    };

} // anonymous namespace

TEST_SUITE("execution_result_accessors")
{
    TEST_CASE("default result is a success with empty output")
    {
        execution_result const result{};
        CHECK_FALSE(result.is_fail());
        CHECK(result.get_exit_code() == 0);
        CHECK(result.get_stdout().empty());
        CHECK(result.get_stderr().empty());
    }

    TEST_CASE("non-zero exit status is a failure")
    {
        execution_result const result{{}, to_bytes("boom\n"), 2};
        CHECK(result.is_fail());
        CHECK(result.get_exit_code() == 2);
        CHECK(result.get_stderr() == "boom\n");
    }

    TEST_CASE("streams stay separate")
    {
        execution_result const result{to_bytes("out\n"), to_bytes("err\n"), 0};
        CHECK(result.get_stdout() == "out\n");
        CHECK(result.get_stderr() == "err\n");
    }

    TEST_CASE("raw bytes are kept, text is decoded leniently")
    {
        bytes const raw{'o', 'k', 0xFF};
        execution_result const result{raw, {}, 0};

        CHECK(result.get_stdout_bytes() == raw);
        CHECK(result.get_stdout() == "ok\xEF\xBF\xBD");
    }

    TEST_CASE("lines")
    {
        execution_result const result{to_bytes("a\nb\n"), to_bytes("warning"), 0};

        auto const out = result.get_stdout_lines();
        REQUIRE(out.size() == 2);
        CHECK(out[0] == "a\n");
        CHECK(out[1] == "b\n");

        auto const err = result.get_stderr_lines();
        REQUIRE(err.size() == 1);
        CHECK(err[0] == "warning");
    }
}

TEST_SUITE("execution_result_flush")
{
    TEST_CASE("flush without a channel fails with channel_closed")
    {
        execution_result result{to_bytes("x"), {}, 0};

        auto const flushed = result.flush("more");
        REQUIRE_FALSE(flushed.has_value());
        CHECK(flushed.error() == error::channel_closed);
        CHECK_FALSE(result.accepts_input());
    }

    TEST_CASE("flush appends a newline when missing")
    {
        cat_channel fixture;
        execution_result result{{}, {}, 0, fixture.channel};

        REQUIRE(result.flush("yes").has_value());
        REQUIRE(result.flush("no\n").has_value());

        CHECK(fixture.remote->stdin_text() == "yes\nno\n");
    }

    TEST_CASE("byte flush writes verbatim")
    {
        cat_channel fixture;
        execution_result result{{}, {}, 0, fixture.channel};

        auto const payload = to_bytes("raw");
        REQUIRE(result.flush(std::span<std::uint8_t const>{payload}).has_value());
        CHECK(fixture.remote->stdin_text() == "raw");
    }

    TEST_CASE("empty flush still sends a newline")
    {
        cat_channel fixture;
        execution_result result{{}, {}, 0, fixture.channel};

        REQUIRE(result.flush("").has_value());
        CHECK(fixture.remote->stdin_text() == "\n");
    }

    TEST_CASE("closed channel rejects flush")
    {
        cat_channel fixture;
        execution_result result{{}, {}, 0, fixture.channel};
        CHECK(result.accepts_input());

        fixture.channel->close();

        auto const flushed = result.flush("late");
        REQUIRE_FALSE(flushed.has_value());
        CHECK(flushed.error() == error::channel_closed);
        CHECK(fixture.remote->stdin_text().empty());
    }

    TEST_CASE("released channel rejects flush")
    {
        execution_result result;
        {
            cat_channel fixture;
            result = execution_result{{}, {}, 0, fixture.channel};
        }

        auto const flushed = result.flush("gone");
        REQUIRE_FALSE(flushed.has_value());
        CHECK(flushed.error() == error::channel_closed);
    }

    TEST_CASE("collected exit status ends input even for a stdin reader")
    {
        cat_channel fixture;
        execution_result result{{}, {}, 0, fixture.channel};
        REQUIRE(result.accepts_input());

        REQUIRE(fixture.channel->exit_status().has_value());

        CHECK_FALSE(result.accepts_input());
        auto const flushed = result.flush("late");
        REQUIRE_FALSE(flushed.has_value());
        CHECK(flushed.error() == error::channel_closed);
        CHECK(fixture.remote->stdin_text().empty());
    }

    TEST_CASE("exited process rejects flush")
    {
        auto remote = std::make_shared<fake_remote>();
        fake_transport link{remote};
        REQUIRE(link.connect(test_credentials(), fast_config()).has_value());

        auto channel = link.open_exec("echo hi", {});
        REQUIRE(channel.has_value());
        REQUIRE((*channel)->exit_status().has_value());

        execution_result result{{}, {}, 0, *channel};
        auto const flushed = result.flush("ignored");
        REQUIRE_FALSE(flushed.has_value());
        CHECK(flushed.error() == error::channel_closed);
    }
}
