// DECMAIL - Mail Messages Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/mail/message.h>
#include <decmail/core/errors.h>

namespace decmail {

const char* SignatureStatusToString(SignatureStatus status) {
    switch (status) {
        case SignatureStatus::Absent: return "absent";
        case SignatureStatus::Verified: return "verified";
        case SignatureStatus::Unverified: return "unverified";
        default: return "unknown";
    }
}

std::vector<EmailAddress> Message::AllRecipients() const {
    std::vector<EmailAddress> result;
    for (const auto* list : {&to, &cc, &bcc}) {
        for (const auto& email : *list) {
            bool seen = false;
            for (const auto& existing : result) {
                if (existing.HasSameAddress(email)) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                result.push_back(email);
            }
        }
    }
    return result;
}

// ============================================================================
// Binary Codec
// ============================================================================

Bytes EncodeMessage(const Message& message) {
    DataStream stream;
    stream << MESSAGE_ENCODING_VERSION;
    stream << message.from << message.replyTo;
    stream << message.to << message.cc << message.bcc;
    stream << static_cast<int64_t>(message.date);
    stream << message.subject << message.textBody << message.htmlBody;
    return stream.Data();
}

Message DecodeMessage(const Bytes& data) {
    DataStream stream(data);
    
    uint8_t version = 0;
    stream >> version;
    if (version != MESSAGE_ENCODING_VERSION) {
        throw FormatError("Unknown message encoding version " + std::to_string(version));
    }
    
    Message message;
    int64_t date = 0;
    stream >> message.from >> message.replyTo;
    stream >> message.to >> message.cc >> message.bcc;
    stream >> date;
    stream >> message.subject >> message.textBody >> message.htmlBody;
    message.date = date;
    
    if (!stream.empty()) {
        throw FormatError("Trailing data after encoded message");
    }
    return message;
}

} // namespace decmail
