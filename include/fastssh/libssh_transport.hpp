#pragma once

// libssh_transport.hpp - transport backed by libssh (exec channels + SFTP)

#include "transport.hpp"

#include <memory>

namespace fastssh
{

    [[nodiscard]] auto make_libssh_transport() -> std::unique_ptr<transport>;

} // namespace fastssh
