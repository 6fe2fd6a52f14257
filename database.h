#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <sqlite3.h>

struct TranscriptRecord {
    int id = 0;
    std::string created_at;
    std::string patient_code;
    std::string transcript;
    std::string summary;
};

class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    bool init(const std::string& db_path = "voicechat.db");
    void close();

    // Patient transcripts read by the lookup function
    bool upsert_transcript(const std::string& patient_code, const std::string& transcript,
                           const std::string& summary);
    std::optional<TranscriptRecord> get_transcript(const std::string& patient_code, std::string& error);
    int count_transcripts();

    // System configuration (key/value, seeded with defaults)
    std::optional<std::string> get_config_value(const std::string& key);
    bool set_config_value(const std::string& key, const std::string& value);

    std::string get_orchestrator_status();  // "starting", "running", "stopped", "error"
    bool set_orchestrator_status(const std::string& status);

private:
    sqlite3* db_;
    mutable std::mutex db_mutex_;  // Thread safety for database operations
    bool create_tables();
    std::string get_current_timestamp();
};
