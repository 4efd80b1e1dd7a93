#include "response_relay.hpp"
#include "responses.hpp"
#include "utils/logger.h"

ResponseRelay::ResponseRelay(ResponseSinkPtr sink, const HeaderFilter& filter, HeadHook finalize_head)
    : sink_(std::move(sink)), filter_(filter), finalize_head_(std::move(finalize_head)) {}

void ResponseRelay::start(UpstreamClient& client, UpstreamRequest request) {
    auto self = shared_from_this();
    std::weak_ptr<ResponseRelay> weak = self;
    sink_->set_abort_handler([weak]() {
        if (auto relay = weak.lock()) {
            LOG_DEBUG("Client went away, releasing upstream");
            relay->cancel();
        }
    });

    UpstreamHandlers handlers;
    handlers.on_head = [self](const UpstreamHead& head) { self->on_head(head); };
    handlers.on_chunk = [self](std::string chunk, std::function<void()> read_more) {
        self->on_chunk(std::move(chunk), std::move(read_more));
    };
    handlers.on_complete = [self]() { self->on_complete(); };
    handlers.on_error = [self](const std::string& error) { self->on_error(error); };

    auto call = client.fetch(sink_->get_executor(), std::move(request), std::move(handlers));
    if (!done_) {
        call_ = std::move(call);
    }
}

void ResponseRelay::cancel() {
    done_ = true;
    if (call_) {
        auto call = std::move(call_);
        call_.reset();
        call->cancel();
    }
}

void ResponseRelay::on_head(const UpstreamHead& head) {
    HeaderList headers = filter_.apply(head.headers);
    if (finalize_head_) {
        finalize_head_(headers);
    }
    sink_->send_head(head.status_code, head.reason, headers);
}

void ResponseRelay::on_chunk(std::string chunk, std::function<void()> read_more) {
    auto self = shared_from_this();
    sink_->send_chunk(std::move(chunk), [self, read_more = std::move(read_more)](bool ok) {
        if (ok) {
            read_more();
        } else {
            self->cancel();
        }
    });
}

void ResponseRelay::on_complete() {
    done_ = true;
    call_.reset();
    sink_->finish();
}

void ResponseRelay::on_error(const std::string& error) {
    done_ = true;
    call_.reset();
    LOG_ERROR("Upstream request failed: " << error);
    if (!sink_->head_sent()) {
        sink_->send(bad_gateway_response());
    } else {
        sink_->abort();
    }
}
