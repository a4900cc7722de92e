#pragma once

#include <pylon/common/message_id.hpp>
#include <pylon/common/serialization.hpp>
