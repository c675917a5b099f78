/**
 * @file statuslist.hpp
 * @brief High-level status list API.
 *
 * Typical flow:
 * @code
 * statuslist::StatusListBuilder builder(2);
 * builder.add_status(statuslist::StatusType::Valid)
 *        .add_status(statuslist::StatusType::Suspended);
 * auto list = builder.build();
 * std::string json = statuslist::to_json(list);
 *
 * statuslist::StatusListDecoder decoder(statuslist::from_json(json));
 * auto status = decoder.get_status(1);  // 2
 * @endcode
 */

#ifndef STATUSLIST_HPP
#define STATUSLIST_HPP

#include "bitpacker.hpp"
#include "builder.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "encoding.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "serialization.hpp"
#include "status_list.hpp"
#include "types.hpp"

#endif // STATUSLIST_HPP
