#pragma once

namespace dw {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -32768;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x445745;
PRAGMA user_version = 1;
)";

constexpr int kCurrentSchemaVersion = 1;

// Vectors are stored as float32 BLOBs in host byte order so either HNSW
// graph can be rebuilt from this database alone. A label belongs to at
// most one row per graph. store_meta.generation advances with every
// committed write and is copied into the graph sidecars on save.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS documents (
    document_id TEXT PRIMARY KEY,
    source_path TEXT NOT NULL UNIQUE,
    file_type TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    size_bytes INTEGER NOT NULL DEFAULT 0,
    raw_structure TEXT NOT NULL DEFAULT '{}',
    summary_text TEXT NOT NULL DEFAULT '',
    topics TEXT NOT NULL DEFAULT '[]',
    summary_vector BLOB NOT NULL,
    hnsw_label INTEGER NOT NULL,
    indexed_at REAL NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_documents_label ON documents(hnsw_label);

CREATE TABLE IF NOT EXISTS chunks (
    chunk_id TEXT PRIMARY KEY,
    document_id TEXT NOT NULL REFERENCES documents(document_id) ON DELETE CASCADE,
    sequence_index INTEGER NOT NULL,
    text TEXT NOT NULL,
    locator TEXT NOT NULL DEFAULT '',
    vector BLOB NOT NULL,
    hnsw_label INTEGER NOT NULL,
    prev_chunk_id TEXT,
    next_chunk_id TEXT,
    UNIQUE (document_id, sequence_index)
);

CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, sequence_index);
CREATE UNIQUE INDEX IF NOT EXISTS idx_chunks_label ON chunks(hnsw_label);

CREATE TABLE IF NOT EXISTS store_meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

} // namespace dw
