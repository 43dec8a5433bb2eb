#pragma once

namespace fieldsync::db::sql {

/*
  Canonical SQL for the sqlite backend.

  Column order in every SELECT matches the Read*() helpers in
  sqlite_repository.cpp.
*/

// inspections

static constexpr const char* UPSERT_INSPECTION =
    "INSERT INTO inspections(id,payload,property_id,status,retry_count,created_at_ms,updated_at_ms,error_message)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " payload=excluded.payload,"
    " property_id=excluded.property_id,"
    " status=excluded.status,"
    " retry_count=excluded.retry_count,"
    " created_at_ms=excluded.created_at_ms,"
    " updated_at_ms=excluded.updated_at_ms,"
    " error_message=excluded.error_message;";

static constexpr const char* SELECT_INSPECTION =
    "SELECT id,payload,property_id,status,retry_count,created_at_ms,updated_at_ms,error_message"
    " FROM inspections WHERE id=?;";

static constexpr const char* SELECT_INSPECTIONS_BY_STATUS =
    "SELECT id,payload,property_id,status,retry_count,created_at_ms,updated_at_ms,error_message"
    " FROM inspections WHERE status=? ORDER BY created_at_ms,id;";

static constexpr const char* DELETE_INSPECTION =
    "DELETE FROM inspections WHERE id=?;";

static constexpr const char* COUNT_INSPECTIONS =
    "SELECT COUNT(*) FROM inspections;";

static constexpr const char* CLEAR_INSPECTIONS =
    "DELETE FROM inspections;";

// photos

static constexpr const char* UPSERT_PHOTO =
    "INSERT INTO photos(id,inspection_id,payload,classification,latitude,longitude,accuracy_m,captured_at_ms,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " inspection_id=excluded.inspection_id,"
    " payload=excluded.payload,"
    " classification=excluded.classification,"
    " latitude=excluded.latitude,"
    " longitude=excluded.longitude,"
    " accuracy_m=excluded.accuracy_m,"
    " captured_at_ms=excluded.captured_at_ms,"
    " created_at_ms=excluded.created_at_ms;";

static constexpr const char* SELECT_PHOTO =
    "SELECT id,inspection_id,payload,classification,latitude,longitude,accuracy_m,captured_at_ms,created_at_ms"
    " FROM photos WHERE id=?;";

static constexpr const char* SELECT_PHOTOS_BY_INSPECTION =
    "SELECT id,inspection_id,payload,classification,latitude,longitude,accuracy_m,captured_at_ms,created_at_ms"
    " FROM photos WHERE inspection_id=? ORDER BY created_at_ms,id;";

static constexpr const char* DELETE_PHOTO =
    "DELETE FROM photos WHERE id=?;";

static constexpr const char* COUNT_PHOTOS =
    "SELECT COUNT(*) FROM photos;";

static constexpr const char* CLEAR_PHOTOS =
    "DELETE FROM photos;";

// sync queue

static constexpr const char* INSERT_QUEUE_ENTRY =
    "INSERT INTO sync_queue(id,entity_type,reference_id,priority,enqueued_at_ms,sequence)"
    " VALUES(?,?,?,?,?,(SELECT COALESCE(MAX(sequence),0)+1 FROM sync_queue))"
    " ON CONFLICT(id) DO NOTHING"
    " RETURNING sequence;";

static constexpr const char* SELECT_QUEUE_ENTRY =
    "SELECT id,entity_type,reference_id,priority,enqueued_at_ms,sequence"
    " FROM sync_queue WHERE id=?;";

static constexpr const char* SELECT_QUEUE_ENTRIES =
    "SELECT id,entity_type,reference_id,priority,enqueued_at_ms,sequence"
    " FROM sync_queue ORDER BY priority,enqueued_at_ms,sequence;";

static constexpr const char* DELETE_QUEUE_ENTRY =
    "DELETE FROM sync_queue WHERE id=?;";

static constexpr const char* COUNT_QUEUE_ENTRIES =
    "SELECT COUNT(*) FROM sync_queue;";

static constexpr const char* CLEAR_QUEUE_ENTRIES =
    "DELETE FROM sync_queue;";

}
