#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/frame.hpp"
#include "protocol/json_messages.hpp"
#include "protocol/opcode.hpp"
#include "protocol/player_input.hpp"
#include "protocol/projectile_messages.hpp"
#include "protocol/serializable.hpp"
#include "protocol/transform_snapshot.hpp"
