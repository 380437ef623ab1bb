#include "statusview/message.hpp"

namespace statusview {

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
    const auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

template <typename T>
void readOptional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    const auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

void from_json(const nlohmann::json& j, Progress& progress) {
    readField(j, "current", progress.current);
    readField(j, "total", progress.total);
    readField(j, "start", progress.start);
    readField(j, "hidecounts", progress.hide_counts);
    readField(j, "units", progress.units);
}

void from_json(const nlohmann::json& j, MessageError& error) {
    readField(j, "code", error.code);
    readField(j, "message", error.message);
}

void from_json(const nlohmann::json& j, Message& message) {
    if (!j.is_object()) {
        // raises the library's type_error for non-object values
        static_cast<void>(j.get<nlohmann::json::object_t>());
    }

    readField(j, "stream", message.stream);
    readField(j, "status", message.status);
    readOptional(j, "progressDetail", message.progress);
    readField(j, "progress", message.progress_message);
    readField(j, "id", message.id);
    readField(j, "from", message.from);
    readField(j, "time", message.time);
    readField(j, "timeNano", message.time_nano);
    readOptional(j, "errorDetail", message.error);
    readField(j, "error", message.error_message);

    const auto aux = j.find("aux");
    if (aux != j.end() && !aux->is_null()) {
        message.aux = *aux;
    }
}

} // namespace statusview
