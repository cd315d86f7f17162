//
// Created by the autopatch developers on 10/14/26.
//

#include "libap/notifier.h"

#include <curl/curl.h>
#include <algorithm>
#include <cstring>

namespace ap {

    static std::string to_crlf(const std::string& text) {
        std::string out;
        out.reserve(text.size() + text.size() / 16);
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
                out += '\r';
            }
            out += text[i];
        }
        return out;
    }

    std::string render_message(const Config& config, const std::string& subject, const std::string& body) {
        std::string message;
        message += "Subject: " + subject + "\r\n";
        message += "From: System Update <" + config.smtp.user + ">\r\n";
        message += "To: Admin <" + config.admin_email + ">\r\n";
        message += "\r\n";
        message += to_crlf(body);
        if (message.size() < 2 || message.compare(message.size() - 2, 2, "\r\n") != 0) {
            message += "\r\n";
        }
        return message;
    }

    std::string smtp_url(const SmtpSettings& smtp) {
        return "smtps://" + smtp.server + ":" + std::to_string(smtp.port);
    }

// --- libcurl Callbacks ---

    struct UploadState {
        const std::string* payload;
        size_t offset = 0;
    };

    static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* state = static_cast<UploadState*>(userdata);
        const size_t room = size * nitems;
        const size_t remaining = state->payload->size() - state->offset;
        const size_t n = std::min(room, remaining);
        if (n > 0) {
            std::memcpy(buffer, state->payload->data() + state->offset, n);
            state->offset += n;
        }
        return n; // 0 ends the upload
    }

// --- PIMPL Implementation ---
    struct SmtpNotifier::Impl {
        const Config& config;

        explicit Impl(const Config& conf) : config(conf) {
            curl_global_init(CURL_GLOBAL_ALL);
        }

        ~Impl() {
            curl_global_cleanup();
        }

        std::expected<void, NotifyError> send(const std::string& subject, const std::string& body) {
            std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
            if (!handle) {
                return std::unexpected(NotifyError{"Could not initialise a curl handle."});
            }

            const std::string payload = render_message(config, subject, body);
            UploadState state{&payload};

            std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipients(
                    curl_slist_append(nullptr, config.admin_email.c_str()), &curl_slist_free_all);
            if (!recipients) {
                return std::unexpected(NotifyError{"Could not build the recipient list."});
            }

            const std::string url = smtp_url(config.smtp);
            CURL* easy = handle.get();
            curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
            curl_easy_setopt(easy, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
            curl_easy_setopt(easy, CURLOPT_USERNAME, config.smtp.user.c_str());
            curl_easy_setopt(easy, CURLOPT_PASSWORD, config.smtp.password.c_str());
            curl_easy_setopt(easy, CURLOPT_MAIL_FROM, config.smtp.user.c_str());
            curl_easy_setopt(easy, CURLOPT_MAIL_RCPT, recipients.get());
            curl_easy_setopt(easy, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(easy, CURLOPT_READDATA, &state);
            curl_easy_setopt(easy, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, SMTP_TIMEOUT_SECONDS);
            curl_easy_setopt(easy, CURLOPT_TIMEOUT, SMTP_TIMEOUT_SECONDS);
            curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(easy);
            if (res != CURLE_OK) {
                return std::unexpected(NotifyError{curl_easy_strerror(res)});
            }
            return {};
        }
    };

// --- Public Class Implementation ---
    SmtpNotifier::SmtpNotifier(const Config& config) : pimpl(std::make_unique<Impl>(config)) {}
    SmtpNotifier::~SmtpNotifier() = default;

    std::expected<void, NotifyError> SmtpNotifier::send(const std::string& subject, const std::string& body) {
        return pimpl->send(subject, body);
    }

} // namespace ap
