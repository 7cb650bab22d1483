#pragma once

#include <functional>
#include <memory>
#include <string>
#include "audio_blob.h"

/* One-way hand-off of a finished recording.  Implementations must not block
 * and must not report back into the recording session. */
class SubmissionBridge {
public:
    virtual ~SubmissionBridge() = default;
    virtual void submit(const AudioBlob& blob, int sample_rate) = 0;
};

/* true for an absolute http:// or https:// URL with a host */
bool classifier_url_valid(const std::string& url);

/* file name sent with the "audio" part, from the blob's MIME type */
std::string recording_filename(const std::string& mime_type);

/* ── ClassifierClient ──────────────────────────────────────────────────────
 *
 *  Posts recordings to the genre classifier as multipart/form-data
 *  ("audio" file part, "sample_rate" field).  Each request runs a blocking
 *  libcurl transfer on a GTask worker thread and completes on the main
 *  context that called submit().  Requests are independent and never
 *  awaited; the response body is logged as opaque text.  Transport errors,
 *  malformed URLs and non-2xx statuses go to the failure callback.
 *  Callbacks are dropped once the client is destroyed.
 * ──────────────────────────────────────────────────────────────────────── */

class ClassifierClient : public SubmissionBridge {
public:
    static constexpr const char* DEFAULT_ENDPOINT = "http://127.0.0.1:5000/classify_genre";

    explicit ClassifierClient(const std::string& endpoint = DEFAULT_ENDPOINT);
    ~ClassifierClient() override;

    void set_endpoint(const std::string& endpoint) { endpoint_ = endpoint; }
    const std::string& endpoint() const { return endpoint_; }

    void set_on_response(std::function<void(const std::string&)> cb) { on_response_ = std::move(cb); }
    void set_on_failure(std::function<void(const std::string&)> cb)  { on_failure_  = std::move(cb); }

    void submit(const AudioBlob& blob, int sample_rate) override;

private:
    std::string                             endpoint_;
    std::function<void(const std::string&)> on_response_;
    std::function<void(const std::string&)> on_failure_;
    std::shared_ptr<bool>                   alive_;
};
