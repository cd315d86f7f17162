//
// Created by the autopatch developers on 10/14/26.
//

#pragma once

#include "libap/config.h"

#include <expected>
#include <memory>
#include <string>

namespace ap {

    struct NotifyError {
        std::string message;
    };

    class Notifier {
    public:
        virtual ~Notifier() = default;

        virtual std::expected<void, NotifyError> send(const std::string& subject, const std::string& body) = 0;
    };

    // Submits mail over SMTPS with the configured credentials.
    class SmtpNotifier : public Notifier {
    public:
        explicit SmtpNotifier(const Config& config);
        ~SmtpNotifier() override;

        SmtpNotifier(const SmtpNotifier&) = delete;
        SmtpNotifier& operator=(const SmtpNotifier&) = delete;

        std::expected<void, NotifyError> send(const std::string& subject, const std::string& body) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    // Bounds both the connect and the whole submission, in seconds.
    inline constexpr long SMTP_TIMEOUT_SECONDS = 30;

    // Subject/From/To headers, a blank line, then the body. CRLF line endings throughout.
    std::string render_message(const Config& config, const std::string& subject, const std::string& body);

    std::string smtp_url(const SmtpSettings& smtp);

} // namespace ap
