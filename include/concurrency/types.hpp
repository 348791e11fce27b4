#pragma once

#include "sync/model/Upload.hpp"

#include <variant>

typedef std::variant<bool, sl::sync::model::ItemResult> ExpectedFuture;
