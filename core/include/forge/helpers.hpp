#pragma once

#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "forge/types.pb.h"

namespace forge {

/**
 * Helper functions for working with event books and protobuf types.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Timestamp for a civil UTC date.
 */
google::protobuf::Timestamp date_timestamp(int year, unsigned month, unsigned day);

/**
 * Order two timestamps; an unset (zero) timestamp sorts last.
 */
bool earlier(const google::protobuf::Timestamp& lhs, const google::protobuf::Timestamp& rhs);

/**
 * Append an already packed event to a book as the next page.
 */
inline const EventPage& append_packed(EventBook& book, const google::protobuf::Any& event,
                                      const std::string& actor) {
    auto* page = book.add_pages();
    page->set_sequence(static_cast<uint32_t>(book.pages_size() - 1));
    *page->mutable_event() = event;
    *page->mutable_created_at() = now();
    page->set_actor(actor);
    return *page;
}

/**
 * Pack an event message with the project type URL prefix.
 */
template<typename T>
google::protobuf::Any pack(const T& event_message) {
    google::protobuf::Any any;
    any.PackFrom(event_message, TYPE_URL_PREFIX);
    return any;
}

/**
 * Create an EventBook for an aggregate root.
 */
inline EventBook new_event_book(const std::string& domain, const std::string& root_id) {
    EventBook book;
    book.mutable_cover()->set_domain(domain);
    book.mutable_cover()->set_root_id(root_id);
    return book;
}

} // namespace helpers
} // namespace forge
