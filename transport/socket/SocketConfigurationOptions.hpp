/**
 * \file SocketConfigurationOptions.hpp
 * \brief CLI/config option registration for SocketConfiguration values.
 * \ingroup socket_backend
 * \details JSON section `"socket"` seeds the defaults; `--socket-*` flags
 * override them. Registration happens once, from a static object.
 */
#pragma once

#include "SocketConfiguration.hpp"

namespace transport { namespace socket_opts {
/** \brief Register CLI/config options for socket parameters (idempotent). */
void register_options();
/** \brief Socket configuration assembled from defaults, config file and flags. */
SocketConfiguration get_socket_configuration();
}} // namespace transport::socket_opts
