#pragma once

/// Convenience umbrella header for the boxcar library.

#include <boxcar/convert/field_parser.hpp>
#include <boxcar/convert/typed_reader.hpp>
#include <boxcar/core/column.hpp>
#include <boxcar/core/table.hpp>
#include <boxcar/core/time.hpp>
#include <boxcar/ingest/deduplicator.hpp>
#include <boxcar/ingest/line_normalizer.hpp>
#include <boxcar/ingest/rules.hpp>
#include <boxcar/ingest/source_file.hpp>
#include <boxcar/ingest/text.hpp>
#include <boxcar/output/artifact_reader.hpp>
#include <boxcar/output/columnar_writer.hpp>
#include <boxcar/output/encoding_policy.hpp>
#include <boxcar/pipeline/catalog.hpp>
#include <boxcar/pipeline/config.hpp>
#include <boxcar/pipeline/pipeline.hpp>
#include <boxcar/schema/declaration_file.hpp>
#include <boxcar/schema/field_type.hpp>
#include <boxcar/schema/registry.hpp>
#include <boxcar/schema/relational_type.hpp>
#include <boxcar/schema/retrosheet.hpp>
