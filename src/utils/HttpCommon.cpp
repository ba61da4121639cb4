#include "HttpCommon.hpp"

#include <cpr/cpr.h>

namespace utils
{

namespace
{

void configure(cpr::Session& session, const std::string& url, const HttpTimeouts& timeouts)
{
    session.SetUrl(cpr::Url{ url });
    session.SetConnectTimeout(cpr::ConnectTimeout{ timeouts.connect_ms });
    session.SetTimeout(cpr::Timeout{ timeouts.total_ms });
}

HttpResponse fromCpr(cpr::Response&& r)
{
    HttpResponse response;
    if (r.error)
    {
        response.error = r.error.message.empty() ? "transport error" : r.error.message;
        return response;
    }
    response.status_code = static_cast<int>(r.status_code);
    response.text = std::move(r.text);
    return response;
}

} // namespace

std::string HttpResponse::describe() const
{
    if (!error.empty())
        return error;
    return "HTTP " + std::to_string(status_code);
}

HttpEndpoint::HttpEndpoint(std::string base_url)
    : base_url_(std::move(base_url))
{
    while (!base_url_.empty() && base_url_.back() == '/')
        base_url_.pop_back();
}

std::string HttpEndpoint::urlFor(std::string_view path) const
{
    while (!path.empty() && path.front() == '/')
        path.remove_prefix(1);
    if (path.empty())
        return base_url_;
    std::string url = base_url_;
    url += '/';
    url += path;
    return url;
}

HttpResponse HttpEndpoint::get(std::string_view path, const HttpTimeouts& timeouts) const
{
    cpr::Session session;
    configure(session, urlFor(path), timeouts);
    return fromCpr(session.Get());
}

HttpResponse HttpEndpoint::postJson(std::string_view path, const std::string& body,
                                    const HttpTimeouts& timeouts) const
{
    cpr::Session session;
    configure(session, urlFor(path), timeouts);
    session.SetHeader(cpr::Header{ { "Content-Type", "application/json" } });
    session.SetBody(cpr::Body{ body });
    return fromCpr(session.Post());
}

} // namespace utils
