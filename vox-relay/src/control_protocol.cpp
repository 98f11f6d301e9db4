#include "control_protocol.h"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QString>

namespace voxrelay {

namespace {

std::string ToCompactJson(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact).toStdString();
}

QJsonObject Typed(const char* type) {
    QJsonObject obj;
    obj.insert(QStringLiteral("type"), QString::fromUtf8(type));
    return obj;
}

void SetError(std::string* error, const char* value) {
    if (error) {
        *error = value;
    }
}

std::string ReadString(const QJsonObject& obj, const char* key) {
    const QJsonValue v = obj.value(QString::fromUtf8(key));
    if (!v.isString()) {
        return std::string();
    }
    return v.toString().toStdString();
}

} // namespace

bool TryParseClientMessage(const std::string& json, ClientMessage* out, std::string* error) {
    if (!out) {
        return false;
    }
    *out = ClientMessage{};

    QJsonParseError parse_error{};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        SetError(error, "bad_json");
        return false;
    }
    const QJsonObject obj = doc.object();
    const QJsonValue type_val = obj.value(QStringLiteral("type"));
    if (!type_val.isString()) {
        SetError(error, "missing_type");
        return false;
    }
    const QString type = type_val.toString();

    if (type == QStringLiteral("start")) {
        out->type = ClientMessageType::Start;
        const std::string theme = ReadString(obj, "theme");
        if (!theme.empty()) {
            out->theme = theme;
        }
        out->voice = ReadString(obj, "voice");
        out->resume_handle = ReadString(obj, "resume_handle");
        return true;
    }
    if (type == QStringLiteral("mute")) {
        out->type = ClientMessageType::Mute;
        const QJsonValue muted_val = obj.value(QStringLiteral("muted"));
        if (muted_val.isBool()) {
            out->has_muted = true;
            out->muted = muted_val.toBool();
        }
        return true;
    }
    if (type == QStringLiteral("text")) {
        out->type = ClientMessageType::Text;
        const QJsonValue content_val = obj.value(QStringLiteral("content"));
        if (!content_val.isString() || content_val.toString().isEmpty()) {
            SetError(error, "missing_content");
            return false;
        }
        out->content = content_val.toString().toStdString();
        return true;
    }
    if (type == QStringLiteral("end")) {
        out->type = ClientMessageType::End;
        return true;
    }

    SetError(error, "unknown_type");
    return false;
}

std::string BuildReadyMessage(const std::string& session_id, const std::string& voice) {
    QJsonObject obj = Typed("ready");
    obj.insert(QStringLiteral("sessionId"), QString::fromStdString(session_id));
    obj.insert(QStringLiteral("voice"), QString::fromStdString(voice));
    return ToCompactJson(obj);
}

std::string BuildTranscriptMessage(const TranscriptEntry& entry) {
    QJsonObject obj = Typed("transcript");
    obj.insert(QStringLiteral("role"), QString::fromUtf8(TranscriptRoleName(entry.role)));
    obj.insert(QStringLiteral("text"), QString::fromStdString(entry.text));
    obj.insert(QStringLiteral("timestamp_ms"), static_cast<double>(entry.timestamp_ms));
    return ToCompactJson(obj);
}

std::string BuildToolCallMessage(const ToolCall& call) {
    QJsonObject obj = Typed("tool_call");
    obj.insert(QStringLiteral("id"), QString::fromStdString(call.id));
    obj.insert(QStringLiteral("name"), QString::fromStdString(call.name));
    obj.insert(QStringLiteral("args"), call.args);
    return ToCompactJson(obj);
}

std::string BuildToolResultMessage(const ToolResult& result) {
    QJsonObject obj = Typed("tool_result");
    obj.insert(QStringLiteral("id"), QString::fromStdString(result.id));
    obj.insert(QStringLiteral("name"), QString::fromStdString(result.name));
    obj.insert(QStringLiteral("data"), result.response);
    return ToCompactJson(obj);
}

std::string BuildUiActionMessage(const QJsonObject& action) {
    QJsonObject obj = action;
    obj.insert(QStringLiteral("type"), QStringLiteral("ui_action"));
    return ToCompactJson(obj);
}

std::string BuildGoAwayMessage(std::int64_t time_left_ms) {
    QJsonObject obj = Typed("go_away");
    obj.insert(QStringLiteral("time_left_ms"), static_cast<double>(time_left_ms));
    return ToCompactJson(obj);
}

std::string BuildTurnCompleteMessage() {
    return ToCompactJson(Typed("turn_complete"));
}

std::string BuildInterruptedMessage() {
    return ToCompactJson(Typed("interrupted"));
}

std::string BuildErrorMessage(SessionErrorKind kind, const std::string& message) {
    QJsonObject obj = Typed("error");
    obj.insert(QStringLiteral("message"), QString::fromStdString(message));
    obj.insert(QStringLiteral("code"), QString::fromUtf8(SessionErrorCode(kind)));
    return ToCompactJson(obj);
}

std::string BuildSessionEndMessage(CloseReason reason, const std::string& resume_handle) {
    QJsonObject obj = Typed("session_end");
    obj.insert(QStringLiteral("reason"), QString::fromUtf8(CloseReasonName(reason)));
    if (!resume_handle.empty()) {
        obj.insert(QStringLiteral("resume_handle"), QString::fromStdString(resume_handle));
    }
    return ToCompactJson(obj);
}

std::string BuildStartMessage(
    const std::string& theme,
    const std::string& voice,
    const std::string& resume_handle) {
    QJsonObject obj = Typed("start");
    obj.insert(QStringLiteral("theme"), QString::fromStdString(theme.empty() ? kDefaultTheme : theme));
    if (!voice.empty()) {
        obj.insert(QStringLiteral("voice"), QString::fromStdString(voice));
    }
    if (!resume_handle.empty()) {
        obj.insert(QStringLiteral("resume_handle"), QString::fromStdString(resume_handle));
    }
    return ToCompactJson(obj);
}

std::string BuildMuteMessage(bool muted) {
    QJsonObject obj = Typed("mute");
    obj.insert(QStringLiteral("muted"), muted);
    return ToCompactJson(obj);
}

std::string BuildMuteToggleMessage() {
    return ToCompactJson(Typed("mute"));
}

std::string BuildTextMessage(const std::string& content) {
    QJsonObject obj = Typed("text");
    obj.insert(QStringLiteral("content"), QString::fromStdString(content));
    return ToCompactJson(obj);
}

std::string BuildEndMessage() {
    return ToCompactJson(Typed("end"));
}

bool TryParseServerMessage(const std::string& json, ServerMessage* out) {
    if (!out) {
        return false;
    }
    *out = ServerMessage{};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json));
    if (!doc.isObject()) {
        return false;
    }
    const QJsonObject obj = doc.object();
    const QJsonValue type_val = obj.value(QStringLiteral("type"));
    if (!type_val.isString() || type_val.toString().isEmpty()) {
        return false;
    }
    out->type = type_val.toString().toStdString();
    out->body = obj;
    return true;
}

} // namespace voxrelay
