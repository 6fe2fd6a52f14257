#include "database.h"
#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

bool Database::init(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ Cannot open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better performance
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    return create_tables();
}

void Database::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::create_tables() {
    const char* transcripts_sql = R"(
        CREATE TABLE IF NOT EXISTS transcripts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            created_at TEXT NOT NULL,
            patient_code TEXT UNIQUE NOT NULL,
            transcript TEXT DEFAULT '',
            summary TEXT DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS idx_patient_code ON transcripts(patient_code);
    )";

    // Create system configuration table
    const char* system_config_sql = R"(
        CREATE TABLE IF NOT EXISTS system_config (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('server_port', '8000');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('whisper_model_path', 'models/ggml-base.en.bin');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('llama_model_path', 'models/llama-7b-q4_0.gguf');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('piper_model_path', 'models/voice.onnx');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('piper_espeak_data_path', 'espeak-ng-data');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('stt_timeout_ms', '30000');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('llm_timeout_ms', '60000');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('tts_timeout_ms', '15000');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('lookup_timeout_ms', '10000');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('max_synthesis', '4');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('session_timeout', '3600');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('audio_frames', 'replace');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('orchestrator_status', 'stopped');
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, transcripts_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ SQL error creating transcripts table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    rc = sqlite3_exec(db_, system_config_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ SQL error creating system_config table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

std::string Database::get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

bool Database::upsert_transcript(const std::string& patient_code, const std::string& transcript,
                                 const std::string& summary) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = R"(
        INSERT INTO transcripts (created_at, patient_code, transcript, summary)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(patient_code) DO UPDATE SET transcript = excluded.transcript, summary = excluded.summary
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ SQLite prepare error in upsert_transcript(): " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }

    std::string timestamp = get_current_timestamp();
    sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, patient_code.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, transcript.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, summary.c_str(), -1, SQLITE_STATIC);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
        std::cerr << "❌ SQLite step error in upsert_transcript(): " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* value = (const char*)sqlite3_column_text(stmt, col);
    return value ? std::string(value) : std::string();
}

std::optional<TranscriptRecord> Database::get_transcript(const std::string& patient_code, std::string& error) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        error = "database is not open";
        return std::nullopt;
    }

    const char* sql = "SELECT id, created_at, patient_code, transcript, summary FROM transcripts WHERE patient_code = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = sqlite3_errmsg(db_);
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, patient_code.c_str(), -1, SQLITE_STATIC);

    std::optional<TranscriptRecord> record;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        TranscriptRecord r;
        r.id = sqlite3_column_int(stmt, 0);
        r.created_at = column_text(stmt, 1);
        r.patient_code = column_text(stmt, 2);
        r.transcript = column_text(stmt, 3);
        r.summary = column_text(stmt, 4);
        record = r;
    } else if (rc == SQLITE_DONE) {
        error.clear();  // no such row
    } else {
        error = sqlite3_errmsg(db_);
    }
    sqlite3_finalize(stmt);
    return record;
}

int Database::count_transcripts() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return -1;

    sqlite3_stmt* stmt = nullptr;
    int count = -1;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM transcripts", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
    }
    sqlite3_finalize(stmt);
    return count;
}

std::optional<std::string> Database::get_config_value(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        std::cerr << "❌ Database connection is null in get_config_value()" << std::endl;
        return std::nullopt;
    }

    const char* sql = "SELECT value FROM system_config WHERE key = ?";
    sqlite3_stmt* stmt = nullptr;
    std::optional<std::string> value;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        int step_result = sqlite3_step(stmt);
        if (step_result == SQLITE_ROW) {
            const char* text = (const char*)sqlite3_column_text(stmt, 0);
            if (text) {
                value = std::string(text);
            }
        } else if (step_result != SQLITE_DONE) {
            std::cerr << "❌ SQLite step error in get_config_value(): " << sqlite3_errmsg(db_) << std::endl;
        }
    } else {
        std::cerr << "❌ SQLite prepare error in get_config_value(): " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(stmt);
    return value;
}

bool Database::set_config_value(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "INSERT OR REPLACE INTO system_config (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP)";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_STATIC);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return result == SQLITE_DONE;
    }
    sqlite3_finalize(stmt);
    return false;
}

std::string Database::get_orchestrator_status() {
    return get_config_value("orchestrator_status").value_or("stopped");
}

bool Database::set_orchestrator_status(const std::string& status) {
    return set_config_value("orchestrator_status", status);
}
