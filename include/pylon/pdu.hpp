#pragma once

#include <pylon/pdu/transit_request.hpp>
#include <pylon/pdu/file_offer.hpp>
#include <pylon/pdu/offer_answer.hpp>
#include <pylon/pdu/file_chunk.hpp>
#include <pylon/pdu/transfer_ack.hpp>
#include <pylon/pdu/transfer_abort.hpp>
