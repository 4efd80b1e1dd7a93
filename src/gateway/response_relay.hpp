#pragma once

#include "header_filter.hpp"
#include "transport/http_client.hpp"

#include <functional>
#include <memory>

// Pipes one upstream exchange into a ResponseSink: filtered head first, then
// the body chunk by chunk. The next upstream read waits for the previous
// chunk to be written, and a client that goes away cancels the upstream call.
class ResponseRelay : public std::enable_shared_from_this<ResponseRelay> {
public:
    using HeadHook = std::function<void(HeaderList&)>;

    ResponseRelay(ResponseSinkPtr sink, const HeaderFilter& filter, HeadHook finalize_head = {});

    void start(UpstreamClient& client, UpstreamRequest request);
    void cancel();

private:
    void on_head(const UpstreamHead& head);
    void on_chunk(std::string chunk, std::function<void()> read_more);
    void on_complete();
    void on_error(const std::string& error);

    ResponseSinkPtr sink_;
    const HeaderFilter& filter_;
    HeadHook finalize_head_;
    std::shared_ptr<UpstreamCall> call_;
    bool done_ = false;
};
