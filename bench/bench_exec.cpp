// bench/bench_exec.cpp - output drain loop and text decoding, no network involved

#include "fastssh/command_executor.hpp"
#include "fastssh/text.hpp"

#include <fmt/format.h>
#include <nanobench.h>

#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace bench
{

    namespace
    {

        // replays a fixed transcript; every wait makes the next chunk readable
        class memory_channel final : public fastssh::exec_channel
        {
        public:
            explicit memory_channel(std::vector<std::pair<fastssh::output_stream, std::string>> const &transcript)
                : transcript_{transcript}
            {
            }

            [[nodiscard]] auto read_some(fastssh::output_stream const which, std::span<std::uint8_t> const buffer)
                -> fastssh::result<std::size_t> override
            {
                auto &pending = pending_[static_cast<std::size_t>(which)];
                auto const n = std::min(buffer.size(), pending.size() - offset_[static_cast<std::size_t>(which)]);
                std::copy_n(pending.begin() + static_cast<std::ptrdiff_t>(offset_[static_cast<std::size_t>(which)]),
                            n, buffer.begin());
                offset_[static_cast<std::size_t>(which)] += n;
                return n;
            }

            [[nodiscard]] auto at_eof(fastssh::output_stream const which) -> bool override
            {
                auto const index = static_cast<std::size_t>(which);
                return next_ == transcript_.size() && offset_[index] == pending_[index].size();
            }

            [[nodiscard]] auto wait_readable(std::chrono::milliseconds /*timeout*/) -> fastssh::void_result override
            {
                if (next_ < transcript_.size())
                {
                    auto const &[stream, data] = transcript_[next_++];
                    pending_[static_cast<std::size_t>(stream)].append(data);
                }
                return {};
            }

            [[nodiscard]] auto write(std::span<std::uint8_t const> /*data*/) -> fastssh::void_result override
            {
                return std::unexpected(fastssh::error::channel_closed);
            }

            [[nodiscard]] auto send_eof() -> fastssh::void_result override { return {}; }
            [[nodiscard]] auto exit_status() -> fastssh::result<int> override { return 0; }
            [[nodiscard]] auto accepts_input() -> bool override { return false; }
            auto close() noexcept -> void override {}

        private:
            std::vector<std::pair<fastssh::output_stream, std::string>> const &transcript_;
            std::size_t next_{0};
            std::array<std::string, 2> pending_{};
            std::array<std::size_t, 2> offset_{};
        };

        [[nodiscard]] auto make_transcript(std::size_t const chunks, std::size_t const chunk_size)
            -> std::vector<std::pair<fastssh::output_stream, std::string>>
        {
            std::vector<std::pair<fastssh::output_stream, std::string>> transcript;
            transcript.reserve(chunks);
            for (std::size_t i = 0; i < chunks; ++i)
            {
                // every eighth chunk on stderr, roughly what a chatty build looks like
                auto const stream = i % 8 == 7 ? fastssh::output_stream::err : fastssh::output_stream::out;
                transcript.emplace_back(stream, std::string(chunk_size, static_cast<char>('a' + i % 26)));
            }
            return transcript;
        }

        auto drain_transcript(std::vector<std::pair<fastssh::output_stream, std::string>> const &transcript,
                              std::size_t const read_size) -> std::size_t
        {
            memory_channel channel{transcript};
            std::size_t total = 0;
            auto const drained = fastssh::drain_output(
                channel, [&](fastssh::output_stream, std::span<std::uint8_t const> const chunk) { total += chunk.size(); },
                fastssh::drain_options{.poll_interval = std::chrono::milliseconds{0},
                                       .chunk_size = read_size,
                                       .deadline = std::nullopt,
                                       .cancel = nullptr});
            if (!drained.has_value())
            {
                fmt::print(stderr, "drain failed: {}\n", drained.error());
            }
            return total;
        }

    } // namespace

    void run_drain_benchmarks()
    {
        using namespace ankerl::nanobench;

        auto const lines = make_transcript(1000, 80);
        auto const blocks = make_transcript(64, 32 * 1024);

        Bench().batch(1000 * 80).unit("byte").run("Drain_Lines_32KiB",
                                                  [&] { doNotOptimizeAway(drain_transcript(lines, 32 * 1024)); });

        Bench().batch(64 * 32 * 1024).unit("byte").run("Drain_Blocks_32KiB",
                                                        [&] { doNotOptimizeAway(drain_transcript(blocks, 32 * 1024)); });

        Bench().batch(64 * 32 * 1024).unit("byte").run("Drain_Blocks_4KiB",
                                                        [&] { doNotOptimizeAway(drain_transcript(blocks, 4 * 1024)); });
    }

    void run_text_benchmarks()
    {
        using namespace ankerl::nanobench;

        std::string ascii;
        std::string mixed;
        for (int i = 0; i < 4096; ++i)
        {
            ascii += "compiling module_" + std::to_string(i) + ".o\n";
            mixed += "caf\xC3\xA9 \xE2\x82\xAC ok \xFF\n";
        }
        auto const ascii_bytes = fastssh::to_bytes(ascii);
        auto const mixed_bytes = fastssh::to_bytes(mixed);

        Bench().batch(ascii_bytes.size()).unit("byte").run("Decode_Ascii",
                                                            [&] { doNotOptimizeAway(fastssh::decode_text(ascii_bytes)); });

        Bench().batch(mixed_bytes.size()).unit("byte").run("Decode_Mixed_Malformed",
                                                            [&] { doNotOptimizeAway(fastssh::decode_text(mixed_bytes)); });

        Bench().batch(ascii.size()).unit("byte").run("Split_Lines", [&] { doNotOptimizeAway(fastssh::split_lines(ascii)); });
    }

} // namespace bench
