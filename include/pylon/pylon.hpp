#pragma once

#include <pylon/version.hpp>
#include <pylon/logger.hpp>
#include <pylon/config.hpp>
#include <pylon/error.hpp>
#include <pylon/cancellation.hpp>
#include <pylon/progress.hpp>

#include <pylon/channel/secure_channel.hpp>
#include <pylon/channel/channel_error.hpp>
#include <pylon/channel/local_rendezvous.hpp>

#include <pylon/transfer/relay_hint.hpp>
#include <pylon/transfer/received_offer.hpp>

#include <pylon/session.hpp>
#include <pylon/session_builder.hpp>
