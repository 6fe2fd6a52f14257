#pragma once

#include "collaborators.h"
#include "database.h"

#include <memory>

// Answers lookups from the transcripts table
class DatabaseRecordLookup : public RecordLookup {
public:
    explicit DatabaseRecordLookup(std::shared_ptr<Database> database);

    bool lookup(const LookupQuery& query, std::string& result, std::string& error) override;

private:
    std::shared_ptr<Database> database_;
};

// Text handed to the model for a found record
std::string render_transcript_record(const TranscriptRecord& record, LookupKind kind);
