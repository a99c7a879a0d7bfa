#pragma once

#include "vox_err.h"

#include <map>
#include <string>

/**
 * @brief 服务端消息类型（按 "type" 字段分发）
 */
enum class InboundType {
    Ping,
    InitiationMetadata,
    Audio,
    UserTranscript,
    AgentResponse,
    Unknown,
};

/**
 * @brief 解析后的服务端消息
 *
 * 只填充与 type 对应的字段。
 */
struct InboundMessage {
    InboundType type = InboundType::Unknown;
    std::string type_name;       ///< 原始 type 字符串
    std::string event_id_json;   ///< ping: event_id 的 JSON 文本（保持原类型回传）
    std::string conversation_id; ///< conversation_initiation_metadata
    std::string audio_base64;    ///< audio
    std::string text;            ///< user_transcript / agent_response
};

/**
 * @brief 会话初始化参数
 */
struct SessionInitiation {
    std::string language = "en";
    std::string user_id;
    std::map<std::string, std::string> dynamic_variables;
};

/**
 * @brief 解析一条文本帧
 * @return VOX_ERR_PROTOCOL JSON 无法解析或缺少 type
 */
vox_err_t parseInboundMessage(const char* data, size_t len, InboundMessage& out);

/**
 * {"type":"conversation_initiation_client_data","user_id":...,
 *  "conversation_config_override":{"agent":{"language":...}},"dynamic_variables":{...}}
 */
std::string buildInitiationMessage(const SessionInitiation& init);

/**
 * {"user_audio_chunk":"<base64>"}
 */
std::string buildAudioChunkMessage(const std::string& audio_base64);

/**
 * {"type":"pong","event_id":<与 ping 相同>}
 */
std::string buildPongMessage(const std::string& event_id_json);

/**
 * {"type":"user_message","text":...}
 */
std::string buildUserMessage(const std::string& text);
