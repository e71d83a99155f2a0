#pragma once

#include <libpq-fe.h>

// Test doubles linked in place of libpq. Each PQexec / PQexecParams call pops
// the next queued result; an empty queue behaves like a lost connection.
extern "C" {
  void fake_pg_clear_queue();
  void fake_pg_set_connect_ok(int ok);
  void fake_pg_queue_null();
  // cols_csv: "a,b"; rows_csv: rows split by ';', cells by ',', "<NULL>" for NULL.
  void fake_pg_queue_response(ExecStatusType status, const char* errmsg, const char* sqlstate, const char* cols_csv, const char* rows_csv, const char* cmd_tuples);
  // Statement text and parameters of the most recent call.
  const char* fake_pg_last_sql();
  int fake_pg_last_nparams();
  const char* fake_pg_last_param(int i);
  int fake_pg_calls();
}
