#pragma once

// TabulaCore - typed records, data access and change notification
//
// Usage:
//   #include <TabulaCore.hpp>
//
//   struct Band : tabula::entity<Band> {
//       Band(std::string name = "", int64_t formed = 0) {
//           add(tabula::scalar_member("name", std::move(name)));
//           add(tabula::scalar_member("formed", formed));
//       }
//   };
//
//   tabula::notifier<Band> bands(backend);
//   auto token = bands.observe([](const std::vector<Band>& all) { ... });
//   bands.create(Band{"Slayer", 1981});   // observers receive the new list

#include "tabula/types.hpp"
#include "tabula/log.hpp"
#include "tabula/errors.hpp"
#include "tabula/json.hpp"
#include "tabula/members.hpp"
#include "tabula/schema.hpp"
#include "tabula/record.hpp"
#include "tabula/store.hpp"
#include "tabula/dao.hpp"
#include "tabula/repository.hpp"
#include "tabula/scheduler.hpp"
#include "tabula/observation.hpp"
#include "tabula/broadcast.hpp"
#include "tabula/configuration.hpp"
#include "tabula/notifier.hpp"
