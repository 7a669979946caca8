// file_transfer.cpp - SFTP upload/download and in-place edit helpers

#include "fastssh/file_transfer.hpp"
#include "fastssh/log.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fastssh
{

    namespace
    {

        // SFTP chunk size - 32KB is safe for most servers
        constexpr std::size_t SFTP_CHUNK_SIZE = 32 * 1024;

        [[nodiscard]] auto local_failure(std::filesystem::path const &path) -> error
        {
            std::error_code ec;
            auto const status = std::filesystem::status(path, ec);
            if (ec || !std::filesystem::exists(status))
            {
                return error::transfer_not_found;
            }
            if (std::filesystem::is_directory(status))
            {
                return error::transfer_io_failure;
            }
            if (::access(path.c_str(), R_OK) != 0 && (errno == EACCES || errno == EPERM))
            {
                return error::transfer_permission_denied;
            }
            return error::transfer_io_failure;
        }

        // RE2 never backtracks or recurses, so long single-line files are safe
        [[nodiscard]] auto compile_pattern(std::string const &pattern, std::string const &replacement)
            -> result<std::unique_ptr<RE2 const>>
        {
            auto expression = std::make_unique<RE2 const>(pattern, RE2::Quiet);
            if (!expression->ok())
            {
                log::warn("invalid pattern '{}': {}", pattern, expression->error());
                return std::unexpected(error::invalid_argument);
            }

            std::string why;
            if (!expression->CheckRewriteString(replacement, &why))
            {
                log::warn("invalid replacement '{}': {}", replacement, why);
                return std::unexpected(error::invalid_argument);
            }
            return expression;
        }

        // length of the UTF-8 sequence starting at pos, 1 for stray bytes
        [[nodiscard]] auto code_point_length(std::string_view const text, std::size_t const pos) -> std::size_t
        {
            auto next = pos + 1;
            while (next < text.size() && (static_cast<unsigned char>(text[next]) & 0xC0U) == 0x80U)
            {
                ++next;
            }
            return next - pos;
        }

        [[nodiscard]] auto replace_matches(RE2 const &expression, std::string_view const text,
                                           std::string const &replacement, std::size_t const count)
            -> result<std::string>
        {
            auto const groups = 1 + RE2::MaxSubmatch(replacement);
            std::vector<re2::StringPiece> match(static_cast<std::size_t>(groups));
            re2::StringPiece const input{text.data(), text.size()};

            std::string out;
            out.reserve(text.size());

            std::size_t copied = 0;
            std::size_t search = 0;
            std::size_t replaced = 0;
            while (replaced < count && search <= text.size() &&
                   expression.Match(input, search, text.size(), RE2::UNANCHORED, match.data(), groups))
            {
                auto const begin = static_cast<std::size_t>(match[0].data() - text.data());
                auto const end = begin + match[0].size();

                out.append(text.substr(copied, begin - copied));
                if (!expression.Rewrite(&out, replacement, match.data(), groups))
                {
                    return std::unexpected(error::invalid_argument);
                }
                copied = end;
                search = end;
                ++replaced;

                // an empty match consumes one character so the scan moves on
                if (begin == end)
                {
                    if (end == text.size())
                    {
                        break;
                    }
                    auto const step = code_point_length(text, end);
                    out.append(text.substr(end, step));
                    copied = end + step;
                    search = end + step;
                }
            }
            out.append(text.substr(std::min(copied, text.size())));

            return out;
        }

        [[nodiscard]] auto write_all(remote_file &file, std::span<std::uint8_t const> data) -> void_result
        {
            std::size_t offset = 0;
            while (offset < data.size())
            {
                auto written = file.write(data.subspan(offset));
                if (!written.has_value())
                {
                    return std::unexpected(written.error());
                }
                if (*written == 0)
                {
                    return std::unexpected(error::transfer_io_failure);
                }
                offset += *written;
            }
            return {};
        }

    } // namespace

    // =============================================================================
    // payload helpers
    // =============================================================================

    auto resolve_payload(std::string_view const content) -> transfer_payload
    {
        // paths never contain NUL; filesystem calls would truncate them
        if (!content.empty() && content.find('\0') == std::string_view::npos)
        {
            std::error_code ec;
            std::filesystem::path const candidate{content};
            if (std::filesystem::is_regular_file(candidate, ec))
            {
                return local_path{candidate};
            }
        }
        return raw_bytes{to_bytes(content)};
    }

    auto read_local_file(std::filesystem::path const &path) -> result<bytes>
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            return std::unexpected(local_failure(path));
        }

        bytes data{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        if (file.bad())
        {
            return std::unexpected(error::transfer_io_failure);
        }

        return data;
    }

    auto replace_text(std::string_view const text, std::string_view const old_text, std::string_view const new_text,
                      std::size_t const count) -> std::string
    {
        if (old_text.empty() || count == 0)
        {
            return std::string{text};
        }

        std::string out;
        out.reserve(text.size());

        std::size_t replaced = 0;
        std::size_t pos = 0;
        while (replaced < count)
        {
            auto const found = text.find(old_text, pos);
            if (found == std::string_view::npos)
            {
                break;
            }
            out.append(text.substr(pos, found - pos));
            out.append(new_text);
            pos = found + old_text.size();
            ++replaced;
        }
        out.append(text.substr(pos));

        return out;
    }

    auto regex_replace_text(std::string const &text, std::string const &pattern, std::string const &replacement,
                            std::size_t const count) -> result<std::string>
    {
        auto expression = compile_pattern(pattern, replacement);
        if (!expression.has_value())
        {
            return std::unexpected(expression.error());
        }
        return replace_matches(**expression, text, replacement, count);
    }

    // =============================================================================
    // file_transfer_channel
    // =============================================================================

    auto file_transfer_channel::send_file(std::string_view const remote_path, transfer_payload const &payload,
                                          int const mode) -> void_result
    {
        if (auto const *raw = std::get_if<raw_bytes>(&payload))
        {
            return send_file(remote_path, raw->data, mode);
        }

        auto const &path = std::get<local_path>(payload).path;

        // open the local side first so a missing source never truncates the remote file
        std::ifstream source(path, std::ios::binary);
        if (!source)
        {
            auto const failure = local_failure(path);
            log::warn("cannot read local file '{}': {}", path.string(), failure);
            return std::unexpected(failure);
        }

        auto sftp = link_.open_sftp();
        if (!sftp.has_value())
        {
            return std::unexpected(sftp.error());
        }

        auto file = (*sftp)->open_for_write(remote_path, mode);
        if (!file.has_value())
        {
            return std::unexpected(file.error());
        }

        std::array<char, SFTP_CHUNK_SIZE> chunk{};
        std::uint64_t total = 0;
        while (source)
        {
            source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            auto const got = static_cast<std::size_t>(source.gcount());
            if (got == 0)
            {
                break;
            }

            auto const data = std::span<std::uint8_t const>{reinterpret_cast<std::uint8_t const *>(chunk.data()), got};
            if (auto written = write_all(**file, data); !written.has_value())
            {
                return written;
            }
            total += got;
        }

        if (source.bad())
        {
            return std::unexpected(error::transfer_io_failure);
        }

        log::debug("uploaded {} -> {} ({} bytes)", path.string(), remote_path, total);
        return {};
    }

    auto file_transfer_channel::send_file(std::string_view const remote_path, std::span<std::uint8_t const> const data,
                                          int const mode) -> void_result
    {
        auto sftp = link_.open_sftp();
        if (!sftp.has_value())
        {
            return std::unexpected(sftp.error());
        }

        auto file = (*sftp)->open_for_write(remote_path, mode);
        if (!file.has_value())
        {
            return std::unexpected(file.error());
        }

        if (auto written = write_all(**file, data); !written.has_value())
        {
            log::warn("upload to {} failed after open: {}", remote_path, written.error());
            return written;
        }

        log::debug("uploaded {} bytes -> {}", data.size(), remote_path);
        return {};
    }

    auto file_transfer_channel::download_file(std::string_view const remote_path) -> result<bytes>
    {
        auto sftp = link_.open_sftp();
        if (!sftp.has_value())
        {
            return std::unexpected(sftp.error());
        }

        // get file size
        auto const size = (*sftp)->file_size(remote_path);
        if (!size.has_value())
        {
            return std::unexpected(size.error());
        }

        auto file = (*sftp)->open_for_read(remote_path);
        if (!file.has_value())
        {
            return std::unexpected(file.error());
        }

        bytes buffer;
        buffer.reserve(static_cast<std::size_t>(*size));

        std::array<std::uint8_t, SFTP_CHUNK_SIZE> chunk{};
        while (true)
        {
            auto nbytes = (*file)->read(chunk);
            if (!nbytes.has_value())
            {
                return std::unexpected(nbytes.error());
            }
            if (*nbytes == 0)
            {
                break;
            }
            buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*nbytes));
        }

        log::debug("downloaded {} ({} bytes)", remote_path, buffer.size());
        return buffer;
    }

    auto file_transfer_channel::remove_file(std::string_view const remote_path) -> void_result
    {
        auto sftp = link_.open_sftp();
        if (!sftp.has_value())
        {
            return std::unexpected(sftp.error());
        }

        return (*sftp)->remove(remote_path);
    }

    auto file_transfer_channel::file_matches(std::string_view const remote_path, std::filesystem::path const &local)
        -> result<bool>
    {
        auto remote = download_file(remote_path);
        if (!remote.has_value())
        {
            return std::unexpected(remote.error());
        }

        auto mine = read_local_file(local);
        if (!mine.has_value())
        {
            return std::unexpected(mine.error());
        }

        auto const same = *remote == *mine;
        if (!same)
        {
            log::info("{} differs from {} ({} vs {} bytes)", remote_path, local.string(), remote->size(),
                      mine->size());
        }
        return same;
    }

    auto file_transfer_channel::edit_file(std::string_view const remote_path, edit_fn const &edit) -> void_result
    {
        auto original = download_file(remote_path);
        if (!original.has_value())
        {
            return std::unexpected(original.error());
        }

        auto const edited = edit(std::move(*original));
        return send_file(remote_path, std::span<std::uint8_t const>{edited});
    }

    auto file_transfer_channel::edit_file_replace(std::string_view const remote_path, std::string_view const old_text,
                                                  std::string_view const new_text, std::size_t const count)
        -> void_result
    {
        return edit_file(remote_path,
                         [&](bytes content)
                         { return to_bytes(replace_text(as_string_view(content), old_text, new_text, count)); });
    }

    auto file_transfer_channel::edit_file_regex_replace(std::string_view const remote_path, std::string const &pattern,
                                                        std::string const &replacement, std::size_t const count)
        -> void_result
    {
        // compiled before touching the remote file
        auto expression = compile_pattern(pattern, replacement);
        if (!expression.has_value())
        {
            return std::unexpected(expression.error());
        }

        return edit_file(remote_path,
                         [&](bytes content)
                         {
                             auto replaced = replace_matches(**expression, as_string_view(content), replacement, count);
                             return replaced.has_value() ? to_bytes(*replaced) : content;
                         });
    }

} // namespace fastssh
