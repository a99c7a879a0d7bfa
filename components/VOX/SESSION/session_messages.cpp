#include "session_messages.h"
#include "cJSON.h"

#include <cstdlib>
#include <cstring>

static const char* TAG = "SessionMsg";

namespace {

std::string printAndDelete(cJSON* root) {
    std::string out;
    char* str = cJSON_PrintUnformatted(root);
    if (str) {
        out = str;
        free(str);
    }
    cJSON_Delete(root);
    return out;
}

// obj[outer][inner] as string, empty if absent
std::string nestedString(cJSON* root, const char* outer, const char* inner) {
    cJSON* ev = cJSON_GetObjectItem(root, outer);
    if (!cJSON_IsObject(ev)) {
        return std::string();
    }
    cJSON* item = cJSON_GetObjectItem(ev, inner);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        return std::string();
    }
    return item->valuestring;
}

} // namespace

vox_err_t parseInboundMessage(const char* data, size_t len, InboundMessage& out) {
    out = InboundMessage();
    if (!data || len == 0) {
        return VOX_ERR_PROTOCOL;
    }

    cJSON* root = cJSON_ParseWithLength(data, len);
    if (!root) {
        VOX_LOGW(TAG, "Failed to parse JSON (len=%u)", (unsigned)len);
        return VOX_ERR_PROTOCOL;
    }

    cJSON* type_item = cJSON_GetObjectItem(root, "type");
    if (!cJSON_IsString(type_item) || type_item->valuestring == nullptr) {
        VOX_LOGW(TAG, "Message without type");
        cJSON_Delete(root);
        return VOX_ERR_PROTOCOL;
    }

    const char* type = type_item->valuestring;
    out.type_name = type;

    if (strcmp(type, "ping") == 0) {
        out.type = InboundType::Ping;
        cJSON* ev = cJSON_GetObjectItem(root, "ping_event");
        cJSON* id = cJSON_IsObject(ev) ? cJSON_GetObjectItem(ev, "event_id") : nullptr;
        if (!id) {
            VOX_LOGW(TAG, "ping without event_id");
            cJSON_Delete(root);
            return VOX_ERR_PROTOCOL;
        }
        char* id_str = cJSON_PrintUnformatted(id);
        if (id_str) {
            out.event_id_json = id_str;
            free(id_str);
        }

    } else if (strcmp(type, "conversation_initiation_metadata") == 0) {
        out.type = InboundType::InitiationMetadata;
        out.conversation_id = nestedString(root, "conversation_initiation_metadata_event",
                                           "conversation_id");

    } else if (strcmp(type, "audio") == 0) {
        out.type = InboundType::Audio;
        out.audio_base64 = nestedString(root, "audio_event", "audio_base_64");

    } else if (strcmp(type, "user_transcript") == 0) {
        out.type = InboundType::UserTranscript;
        out.text = nestedString(root, "user_transcript_event", "user_transcript");
        if (out.text.empty()) {
            out.text = nestedString(root, "user_transcript_event", "transcript");
        }

    } else if (strcmp(type, "agent_response") == 0) {
        out.type = InboundType::AgentResponse;
        out.text = nestedString(root, "agent_response_event", "agent_response");

    } else {
        out.type = InboundType::Unknown;
    }

    cJSON_Delete(root);
    return VOX_OK;
}

std::string buildInitiationMessage(const SessionInitiation& init) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "conversation_initiation_client_data");
    if (!init.user_id.empty()) {
        cJSON_AddStringToObject(root, "user_id", init.user_id.c_str());
    }

    cJSON* override_obj = cJSON_CreateObject();
    cJSON* agent = cJSON_CreateObject();
    cJSON_AddStringToObject(agent, "language", init.language.c_str());
    cJSON_AddItemToObject(override_obj, "agent", agent);
    cJSON_AddItemToObject(root, "conversation_config_override", override_obj);

    if (!init.dynamic_variables.empty()) {
        cJSON* vars = cJSON_CreateObject();
        for (const auto& kv : init.dynamic_variables) {
            cJSON_AddStringToObject(vars, kv.first.c_str(), kv.second.c_str());
        }
        cJSON_AddItemToObject(root, "dynamic_variables", vars);
    }

    return printAndDelete(root);
}

std::string buildAudioChunkMessage(const std::string& audio_base64) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "user_audio_chunk", audio_base64.c_str());
    return printAndDelete(root);
}

std::string buildPongMessage(const std::string& event_id_json) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "pong");
    cJSON* id = cJSON_Parse(event_id_json.c_str());
    if (id) {
        cJSON_AddItemToObject(root, "event_id", id);
    } else {
        cJSON_AddStringToObject(root, "event_id", event_id_json.c_str());
    }
    return printAndDelete(root);
}

std::string buildUserMessage(const std::string& text) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "user_message");
    cJSON_AddStringToObject(root, "text", text.c_str());
    return printAndDelete(root);
}
