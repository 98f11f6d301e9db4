#include "gemini_live_protocol.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <cmath>
#include <cstdlib>
#include <utility>

namespace voxrelay {

namespace {

std::string ToCompactJson(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact).toStdString();
}

QJsonObject TextPart(const std::string& text) {
    QJsonObject part;
    part.insert(QStringLiteral("text"), QString::fromStdString(text));
    return part;
}

std::string ModelPath(const std::string& model) {
    if (model.rfind("models/", 0) == 0) {
        return model;
    }
    return "models/" + model;
}

bool IsAudioMime(const QString& mime) {
    return mime.startsWith(QStringLiteral("audio/pcm")) || mime.isEmpty();
}

void DecodeServerContent(const QJsonObject& content, std::vector<UpstreamEvent>* events) {
    const QJsonObject model_turn = content.value(QStringLiteral("modelTurn")).toObject();
    const QJsonArray parts = model_turn.value(QStringLiteral("parts")).toArray();
    for (const auto& part_val : parts) {
        const QJsonObject part = part_val.toObject();
        const QJsonObject inline_data = part.value(QStringLiteral("inlineData")).toObject();
        if (!inline_data.isEmpty()) {
            if (!IsAudioMime(inline_data.value(QStringLiteral("mimeType")).toString())) {
                continue;
            }
            const QByteArray pcm = QByteArray::fromBase64(
                inline_data.value(QStringLiteral("data")).toString().toLatin1());
            AudioChunk chunk;
            chunk.samples = DecodePcm16Le(reinterpret_cast<const std::uint8_t*>(pcm.constData()),
                                          static_cast<std::size_t>(pcm.size()));
            if (!chunk.samples.empty()) {
                events->emplace_back(std::move(chunk));
            }
            continue;
        }
        // Reasoning summaries are not part of the spoken reply.
        if (part.value(QStringLiteral("thought")).toBool()) {
            continue;
        }
        const QString text = part.value(QStringLiteral("text")).toString();
        if (!text.isEmpty()) {
            events->emplace_back(TranscriptFragment{TranscriptRole::Assistant, text.toStdString()});
        }
    }

    const QString input_text =
        content.value(QStringLiteral("inputTranscription")).toObject().value(QStringLiteral("text")).toString();
    if (!input_text.isEmpty()) {
        events->emplace_back(TranscriptFragment{TranscriptRole::User, input_text.toStdString()});
    }
    const QString output_text =
        content.value(QStringLiteral("outputTranscription")).toObject().value(QStringLiteral("text")).toString();
    if (!output_text.isEmpty()) {
        events->emplace_back(TranscriptFragment{TranscriptRole::Assistant, output_text.toStdString()});
    }
    if (content.value(QStringLiteral("interrupted")).toBool()) {
        events->emplace_back(Interrupted{});
    }
    if (content.value(QStringLiteral("turnComplete")).toBool()) {
        events->emplace_back(TurnComplete{});
    }
}

void DecodeToolCall(const QJsonObject& tool_call, std::vector<UpstreamEvent>* events) {
    ToolCallBatch batch;
    for (const auto& fc_val : tool_call.value(QStringLiteral("functionCalls")).toArray()) {
        const QJsonObject fc = fc_val.toObject();
        ToolCall call;
        call.id = fc.value(QStringLiteral("id")).toString().toStdString();
        call.name = fc.value(QStringLiteral("name")).toString().toStdString();
        call.args = fc.value(QStringLiteral("args")).toObject();
        if (call.name.empty()) {
            continue;
        }
        batch.calls.push_back(std::move(call));
    }
    if (!batch.calls.empty()) {
        events->emplace_back(std::move(batch));
    }
}

} // namespace

QJsonArray BuildFunctionDeclarations(const ToolRegistry& registry) {
    QJsonArray decls;
    for (const auto& tool : registry.tools()) {
        QJsonObject decl;
        decl.insert(QStringLiteral("name"), QString::fromStdString(tool.name));
        decl.insert(QStringLiteral("description"), QString::fromStdString(tool.description));
        decl.insert(QStringLiteral("behavior"), QStringLiteral("NON_BLOCKING"));
        if (!tool.parameters.isEmpty()) {
            decl.insert(QStringLiteral("parameters"), tool.parameters);
        }
        decls.append(decl);
    }
    return decls;
}

std::string BuildSetupMessage(const UpstreamSetup& setup) {
    QJsonObject voice_config;
    voice_config.insert(
        QStringLiteral("prebuiltVoiceConfig"),
        QJsonObject{{QStringLiteral("voiceName"), QString::fromStdString(setup.voice)}});

    QJsonObject generation_config;
    generation_config.insert(QStringLiteral("responseModalities"), QJsonArray{QStringLiteral("AUDIO")});
    generation_config.insert(
        QStringLiteral("speechConfig"), QJsonObject{{QStringLiteral("voiceConfig"), voice_config}});

    QJsonObject body;
    body.insert(QStringLiteral("model"), QString::fromStdString(ModelPath(setup.model)));
    body.insert(QStringLiteral("generationConfig"), generation_config);
    if (!setup.system_instruction.empty()) {
        body.insert(
            QStringLiteral("systemInstruction"),
            QJsonObject{{QStringLiteral("parts"), QJsonArray{TextPart(setup.system_instruction)}}});
    }
    if (setup.tools && !setup.tools->empty()) {
        body.insert(
            QStringLiteral("tools"),
            QJsonArray{QJsonObject{{QStringLiteral("functionDeclarations"), BuildFunctionDeclarations(*setup.tools)}}});
    }
    QJsonObject resumption;
    if (!setup.resume_handle.empty()) {
        resumption.insert(QStringLiteral("handle"), QString::fromStdString(setup.resume_handle));
    }
    body.insert(QStringLiteral("sessionResumption"), resumption);
    body.insert(
        QStringLiteral("contextWindowCompression"),
        QJsonObject{{QStringLiteral("slidingWindow"), QJsonObject{}}});
    body.insert(QStringLiteral("inputAudioTranscription"), QJsonObject{});
    body.insert(QStringLiteral("outputAudioTranscription"), QJsonObject{});

    QJsonObject msg;
    msg.insert(QStringLiteral("setup"), body);
    return ToCompactJson(msg);
}

std::string BuildRealtimeAudioMessage(const AudioFrame& frame) {
    const std::vector<std::uint8_t> bytes = frame.ToBytes();
    const QByteArray raw(reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size()));

    QJsonObject audio;
    audio.insert(QStringLiteral("data"), QString::fromLatin1(raw.toBase64()));
    audio.insert(QStringLiteral("mimeType"), QString::fromUtf8(kInboundAudioMimeType));

    QJsonObject msg;
    msg.insert(QStringLiteral("realtimeInput"), QJsonObject{{QStringLiteral("audio"), audio}});
    return ToCompactJson(msg);
}

std::string BuildClientTextMessage(const std::string& text) {
    QJsonObject turn;
    turn.insert(QStringLiteral("role"), QStringLiteral("user"));
    turn.insert(QStringLiteral("parts"), QJsonArray{TextPart(text)});

    QJsonObject content;
    content.insert(QStringLiteral("turns"), QJsonArray{turn});
    content.insert(QStringLiteral("turnComplete"), true);

    QJsonObject msg;
    msg.insert(QStringLiteral("clientContent"), content);
    return ToCompactJson(msg);
}

std::string BuildToolResponseMessage(const std::vector<ToolResult>& results) {
    QJsonArray responses;
    for (const auto& result : results) {
        QJsonObject fr;
        fr.insert(QStringLiteral("id"), QString::fromStdString(result.id));
        fr.insert(QStringLiteral("name"), QString::fromStdString(result.name));
        fr.insert(QStringLiteral("response"), result.response);
        fr.insert(QStringLiteral("scheduling"), QString::fromUtf8(SchedulingPolicyName(result.scheduling)));
        responses.append(fr);
    }
    QJsonObject msg;
    msg.insert(QStringLiteral("toolResponse"), QJsonObject{{QStringLiteral("functionResponses"), responses}});
    return ToCompactJson(msg);
}

bool DecodeServerMessage(const QByteArray& json, DecodedServerMessage* out, std::string* error) {
    if (!out) {
        return false;
    }
    *out = DecodedServerMessage{};
    QJsonParseError parse_error{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = "bad_json detail=" + parse_error.errorString().toStdString();
        }
        return false;
    }
    const QJsonObject msg = doc.object();

    if (msg.contains(QStringLiteral("setupComplete"))) {
        out->setup_complete = true;
    }
    if (msg.contains(QStringLiteral("serverContent"))) {
        DecodeServerContent(msg.value(QStringLiteral("serverContent")).toObject(), &out->events);
    }
    if (msg.contains(QStringLiteral("toolCall"))) {
        DecodeToolCall(msg.value(QStringLiteral("toolCall")).toObject(), &out->events);
    }
    if (msg.contains(QStringLiteral("toolCallCancellation"))) {
        ToolCallCancellation cancel;
        const QJsonArray ids =
            msg.value(QStringLiteral("toolCallCancellation")).toObject().value(QStringLiteral("ids")).toArray();
        for (const auto& id : ids) {
            cancel.ids.push_back(id.toString().toStdString());
        }
        out->events.emplace_back(std::move(cancel));
    }
    if (msg.contains(QStringLiteral("sessionResumptionUpdate"))) {
        const QJsonObject update = msg.value(QStringLiteral("sessionResumptionUpdate")).toObject();
        ResumptionUpdate ev;
        ev.new_handle = update.value(QStringLiteral("newHandle")).toString().toStdString();
        ev.resumable = update.value(QStringLiteral("resumable")).toBool();
        out->events.emplace_back(std::move(ev));
    }
    if (msg.contains(QStringLiteral("goAway"))) {
        const QJsonValue time_left = msg.value(QStringLiteral("goAway")).toObject().value(QStringLiteral("timeLeft"));
        GoAway ev;
        if (time_left.isString()) {
            if (!ParseDurationMs(time_left.toString().toStdString(), &ev.time_left_ms)) {
                ev.time_left_ms = 0;
            }
        } else if (time_left.isDouble()) {
            ev.time_left_ms = static_cast<std::int64_t>(time_left.toDouble() * 1000.0);
        }
        out->events.emplace_back(ev);
    }
    return true;
}

bool ParseDurationMs(const std::string& text, std::int64_t* out_ms) {
    if (!out_ms || text.empty()) {
        return false;
    }
    std::string number = text;
    if (number.back() == 's') {
        number.pop_back();
    }
    if (number.empty()) {
        return false;
    }
    char* end = nullptr;
    const double seconds = std::strtod(number.c_str(), &end);
    if (!end || *end != '\0' || seconds < 0.0 || !std::isfinite(seconds)) {
        return false;
    }
    *out_ms = static_cast<std::int64_t>(std::llround(seconds * 1000.0));
    return true;
}

} // namespace voxrelay
