#pragma once
// AssetMind: email attachment routing for a private-markets portfolio
//
// - Types: ids, timestamps, confidence tiers, asset types
// - Stores: semantic, procedural, episodic, contact partitions
// - Gate: deduplication, conflict detection and resolution, audit
// - Scoring: asset identification, document classification
// - Routing: confidence bands, review queue
// - Engine: one object tying it all to a backend and a document sink

#include "types.hpp"
#include "version.hpp"
#include "backend.hpp"
#include "sqlite_backend.hpp"
#include "dedup_gate.hpp"
#include "semantic_store.hpp"
#include "procedural_store.hpp"
#include "episodic_store.hpp"
#include "contact_store.hpp"
#include "asset_identifier.hpp"
#include "document_classifier.hpp"
#include "routing.hpp"
#include "review_queue.hpp"
#include "bootstrap.hpp"
#include "engine.hpp"
