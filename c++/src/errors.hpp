#pragma once

#include <type_traits>

#include <boost/system/error_code.hpp>

enum class StreamError
{
    invalid_range_spec = 1,
    range_not_satisfiable,
    link_not_found,
    metadata_unavailable,
    upstream_transport_error,
    upstream_redirect_unsupported,
    client_disconnected
};

const boost::system::error_category &stream_category();

boost::system::error_code make_error_code(StreamError e);

namespace boost::system
{
template <> struct is_error_code_enum<StreamError> : std::true_type
{};
} // namespace boost::system
