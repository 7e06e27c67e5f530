#include "SBXTypes.h"

namespace SBX {

HostValue BlockContextView::toJson() const {
    HostValue value = HostValue::object();
    value["workflowId"] = workflowId;
    value["runId"] = runId;
    value["phase"] = phase;
    value["sectionId"] = sectionId;
    value["userId"] = userId;
    value["answers"] = answers.is_null() ? HostValue::object() : answers;
    value["metadata"] = metadata.is_null() ? HostValue::object() : metadata;
    return value;
}

BlockContextView BlockContextView::fromJson(const HostValue &value) {
    BlockContextView view;
    view.workflowId = JsonUtils::getString(value, "workflowId");
    view.runId = JsonUtils::getString(value, "runId");
    view.phase = JsonUtils::getString(value, "phase");
    view.sectionId = JsonUtils::getString(value, "sectionId");
    view.userId = JsonUtils::getString(value, "userId");
    if (JsonUtils::hasKey(value, "answers")) {
        view.answers = value.at("answers");
    }
    if (JsonUtils::hasKey(value, "metadata")) {
        view.metadata = value.at("metadata");
    }
    return view;
}

const char *consoleLevelToString(ConsoleLevel level) {
    switch (level) {
    case ConsoleLevel::Log:
        return "log";
    case ConsoleLevel::Info:
        return "info";
    case ConsoleLevel::Warn:
        return "warn";
    case ConsoleLevel::Error:
        return "error";
    }
    return "log";
}

const char *errorTagToString(ErrorTag tag) {
    switch (tag) {
    case ErrorTag::CompileError:
        return "CompileError";
    case ErrorTag::RuntimeError:
        return "RuntimeError";
    case ErrorTag::TimeoutError:
        return "TimeoutError";
    case ErrorTag::MemoryLimitError:
        return "MemoryLimitError";
    case ErrorTag::SandboxUnavailable:
        return "SandboxUnavailable";
    case ErrorTag::MarshallingError:
        return "MarshallingError";
    }
    return "SandboxUnavailable";
}

std::optional<ErrorTag> errorTagFromString(const std::string &name) {
    for (ErrorTag tag : {ErrorTag::CompileError, ErrorTag::RuntimeError, ErrorTag::TimeoutError,
                         ErrorTag::MemoryLimitError, ErrorTag::SandboxUnavailable, ErrorTag::MarshallingError}) {
        if (name == errorTagToString(tag)) {
            return tag;
        }
    }
    return std::nullopt;
}

}  // namespace SBX
