#include "record-lookup.h"
#include "function-directive.h"

#include <iostream>

DatabaseRecordLookup::DatabaseRecordLookup(std::shared_ptr<Database> database)
    : database_(std::move(database)) {
}

std::string render_transcript_record(const TranscriptRecord& record, LookupKind kind) {
    std::string out = "patient_code: " + record.patient_code + "\n";
    out += "created_at: " + record.created_at + "\n";
    out += "summary: " + (record.summary.empty() ? std::string("(none)") : record.summary) + "\n";
    if (kind == LookupKind::FetchRecordByCode) {
        out += "transcript: " + (record.transcript.empty() ? std::string("(none)") : record.transcript) + "\n";
    }
    return out;
}

bool DatabaseRecordLookup::lookup(const LookupQuery& query, std::string& result, std::string& error) {
    if (!database_) {
        error = "no database";
        return false;
    }
    // Codes come from the model; never pass anything outside the allowed alphabet
    if (!is_valid_record_code(query.code)) {
        error = "invalid patient code '" + query.code + "'";
        return false;
    }

    std::string db_error;
    std::optional<TranscriptRecord> record = database_->get_transcript(query.code, db_error);
    if (!record) {
        error = db_error.empty() ? "no record for patient code '" + query.code + "'"
                                 : "database error: " + db_error;
        return false;
    }

    result = render_transcript_record(*record, query.kind);
    std::cout << "📇 Found record for patient " << query.code
              << (query.kind == LookupKind::FetchRecordByCode ? " (full)" : " (summary)") << std::endl;
    return true;
}
