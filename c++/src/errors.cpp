#include <string>

#include "errors.hpp"

namespace
{
class StreamCategory : public boost::system::error_category
{
  public:
    const char *name() const noexcept override { return "rangebridge"; }

    std::string message(int ev) const override
    {
        switch (static_cast<StreamError>(ev))
        {
        case StreamError::invalid_range_spec:
            return "invalid range specification";
        case StreamError::range_not_satisfiable:
            return "range not satisfiable";
        case StreamError::link_not_found:
            return "link not found";
        case StreamError::metadata_unavailable:
            return "metadata store unavailable";
        case StreamError::upstream_transport_error:
            return "upstream transport error";
        case StreamError::upstream_redirect_unsupported:
            return "upstream redirect not supported";
        case StreamError::client_disconnected:
            return "client disconnected";
        }
        return "unknown rangebridge error";
    }
};
} // namespace

const boost::system::error_category &stream_category()
{
    static const StreamCategory category;
    return category;
}

boost::system::error_code make_error_code(StreamError e)
{
    return {static_cast<int>(e), stream_category()};
}
