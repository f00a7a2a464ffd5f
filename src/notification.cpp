/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/notification.hpp"
#include <json/json.h>

namespace meshq {

const char* toString(NoticeKind kind) noexcept {
    switch (kind) {
        case NoticeKind::Processing: return "processing";
        case NoticeKind::Complete:   return "complete";
        case NoticeKind::Failed:     return "failed";
        default: return "unknown";
    }
}

std::string outputUrl(const std::string& outputRef) {
    return "/output/" + outputRef;
}

std::string encodeNotification(const Notification& notice) {
    Json::Value root(Json::objectValue);
    root["job"] = notice.job;
    root["status"] = toString(notice.kind);
    root["message"] = notice.message;
    if (!notice.outputRef.empty()) {
        root["output"] = notice.outputRef;
        root["url"] = outputUrl(notice.outputRef);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

}
