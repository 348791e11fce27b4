#pragma once

#include "remote/Api.hpp"

#include <cstdint>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Lenient readers for the remote service's payloads. Field names vary between server
// versions, so every reader accepts the known aliases and wrapper shapes.
namespace sl::remote::parse {

std::optional<std::string> firstString(const nlohmann::json& obj, std::initializer_list<std::string_view> keys);
std::optional<int64_t> firstNumber(const nlohmann::json& obj, std::initializer_list<std::string_view> keys);

// Epoch millis from a numeric string or one of the date formats the server emits (UTC).
std::optional<int64_t> epochMillis(const std::string& text);

std::vector<sync::model::Project> projectList(const nlohmann::json& body);
std::optional<sync::model::Project> project(const nlohmann::json& obj);

// Strips a data/item/project wrapper around a project detail object.
nlohmann::json unwrapDetail(const nlohmann::json& body);

std::vector<ResolvedUrl> resolvedUrls(const nlohmann::json& body, const std::vector<std::string>& requested);
std::vector<ResolvedUrl> resolvedUrls(const std::string& rawBody, const std::vector<std::string>& requested);

sync::model::UploadTicket ticket(const nlohmann::json& obj);

// Throws std::runtime_error when the server reports success == false.
std::vector<TicketEntry> uploadTaskResponse(const nlohmann::json& body);

bool taskComplete(const nlohmann::json& body);

}
