#include "classifier_client.h"

#include <curl/curl.h>
#include <gio/gio.h>
#include <cstdio>
#include <cstring>

/* ── URL / naming helpers ────────────────────────────────────────────── */

bool classifier_url_valid(const std::string& url)
{
    CURLU *u = curl_url();
    if (!u) return false;

    bool ok = false;
    if (curl_url_set(u, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        char *scheme = nullptr;
        char *host   = nullptr;
        if (curl_url_get(u, CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK &&
            curl_url_get(u, CURLUPART_HOST, &host, 0) == CURLUE_OK) {
            ok = (std::strcmp(scheme, "http") == 0 || std::strcmp(scheme, "https") == 0)
              && host[0] != '\0';
        }
        curl_free(scheme);
        curl_free(host);
    }
    curl_url_cleanup(u);
    return ok;
}

std::string recording_filename(const std::string& mime_type)
{
    /* "audio/webm;codecs=opus" -> "recording.webm" */
    size_t slash = mime_type.find('/');
    if (slash == std::string::npos) return "recording.bin";
    std::string sub = mime_type.substr(slash + 1);
    sub = sub.substr(0, sub.find(';'));
    if (sub.empty()) return "recording.bin";
    return "recording." + sub;
}

/* ── request state ───────────────────────────────────────────────────── */

struct SubmitRequest {
    /* main thread only */
    std::shared_ptr<bool>                   alive;
    std::function<void(const std::string&)> on_response;
    std::function<void(const std::string&)> on_failure;

    /* read by the worker, written before the task starts */
    std::string          endpoint;
    std::vector<uint8_t> audio;
    std::string          mime_type;
    int                  sample_rate = 0;

    /* written by the worker, read after completion */
    long        status = 0;
    std::string response;
    std::string error;
};

static size_t on_curl_write(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *body = static_cast<std::string *>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

/* ── worker thread: one blocking transfer ────────────────────────────── */

static void request_worker(GTask *task, gpointer /*source*/, gpointer task_data,
                           GCancellable * /*cancellable*/)
{
    auto *req = static_cast<SubmitRequest *>(task_data);

    CURL *curl = curl_easy_init();
    if (!curl) {
        req->error = "curl_easy_init failed";
        g_task_return_boolean(task, FALSE);
        return;
    }

    curl_mime *mime = curl_mime_init(curl);
    curl_mimepart *part = curl_mime_addpart(mime);
    curl_mime_name(part, "audio");
    curl_mime_filename(part, recording_filename(req->mime_type).c_str());
    curl_mime_type(part, req->mime_type.c_str());
    curl_mime_data(part, reinterpret_cast<const char *>(req->audio.data()), req->audio.size());

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "sample_rate");
    curl_mime_data(part, std::to_string(req->sample_rate).c_str(), CURL_ZERO_TERMINATED);

    // no "Expect: 100-continue" round trip for uploads
    struct curl_slist *headers = curl_slist_append(nullptr, "Expect:");

    char errbuf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl, CURLOPT_URL, req->endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "GenreRecorder");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_curl_write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &req->response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK)
        req->error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
    else
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &req->status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    g_task_return_boolean(task, rc == CURLE_OK);
}

/* ── completion (main context) ───────────────────────────────────────── */

static void request_fail(SubmitRequest *req, const std::string& endpoint, const std::string& why)
{
    fprintf(stderr, "Submission to %s failed: %s\n", endpoint.c_str(), why.c_str());
    if (*req->alive && req->on_failure) req->on_failure(why);
}

static void on_request_done(GObject * /*source*/, GAsyncResult *res, gpointer data)
{
    auto *req = static_cast<SubmitRequest *>(data);
    bool ok = g_task_propagate_boolean(G_TASK(res), nullptr);

    if (!ok) {
        request_fail(req, req->endpoint, req->error);
    } else {
        fprintf(stderr, "Classifier replied %ld: %s\n", req->status, req->response.c_str());
        if (req->status < 200 || req->status > 299)
            request_fail(req, req->endpoint, "HTTP status " + std::to_string(req->status));
        else if (*req->alive && req->on_response)
            req->on_response(req->response);
    }
    delete req;
}

/* ── ClassifierClient ────────────────────────────────────────────────── */

ClassifierClient::ClassifierClient(const std::string& endpoint)
    : endpoint_(endpoint), alive_(std::make_shared<bool>(true))
{
}

ClassifierClient::~ClassifierClient()
{
    *alive_ = false;   // in-flight requests finish silently
}

void ClassifierClient::submit(const AudioBlob& blob, int sample_rate)
{
    auto *req        = new SubmitRequest;
    req->alive       = alive_;
    req->on_response = on_response_;
    req->on_failure  = on_failure_;
    req->endpoint    = endpoint_;

    if (!classifier_url_valid(endpoint_)) {
        request_fail(req, endpoint_, "invalid classifier URL");
        delete req;
        return;
    }

    req->audio       = blob.bytes;
    req->mime_type   = blob.mime_type;
    req->sample_rate = sample_rate;

    fprintf(stderr, "Submitting %zu bytes (%s, %d Hz) to %s\n",
            blob.bytes.size(), blob.mime_type.c_str(), sample_rate, endpoint_.c_str());

    GTask *task = g_task_new(nullptr, nullptr, on_request_done, req);
    g_task_set_task_data(task, req, nullptr);   // freed by on_request_done
    g_task_run_in_thread(task, request_worker);
    g_object_unref(task);
}
