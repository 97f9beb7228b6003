// Unit test runner - calls test functions from per-component test files

#include "test_common.hpp"
#include "test_config.hpp"
#include "test_dispatch.hpp"
#include "test_ingest.hpp"
#include "test_ledger.hpp"
#include "test_report.hpp"
#include "test_scenarios.hpp"
#include "test_telemetry.hpp"

int main() {
  using namespace txengine::tests;

  // Common tests
  test_amount_parse();
  test_amount_format();
  test_amount_overflow();
  test_spsc_ring();

  // Ledger tests
  test_record_validity();
  test_engine_rejects_invalid_record();
  test_engine_deposits();
  test_engine_withdrawals();
  test_engine_dispute_resolve();
  test_engine_unmatched_references();
  test_engine_chargeback_locks();
  test_engine_dispute_withdrawal();
  test_engine_negative_available();
  test_engine_held_invariant();
  test_engine_telemetry();
  test_engine_process_records();
  test_registry_get_or_create();
  test_registry_concurrent_create();

  // Telemetry tests
  test_streaming_histogram();
  test_telemetry_sink();
  test_telemetry_concurrent_counters();

  // Dispatch tests
  test_dispatcher_preserves_client_order();
  test_dispatcher_rethrows_invalid_record();
  test_dispatcher_rethrows_source_error();
  test_dispatcher_rejects_bad_config();

  // Ingest tests
  test_csv_split();
  test_csv_reader_records();
  test_csv_reader_column_order();
  test_csv_reader_errors();

  // Report tests
  test_report_format_row();
  test_report_ordering();

  // Config tests
  test_config_defaults();
  test_config_overrides();
  test_config_validation();
  test_config_load_file();

  // End-to-end CSV scenarios
  test_scenario_deposits_one_client();
  test_scenario_withdrawals();
  test_scenario_disputes();
  test_scenario_chargebacks();
  test_scenario_multiple_clients();
  test_scenario_multiple_clients_sharded();
  test_scenario_invalid_record_aborts();
  test_scenario_balance_overflow_aborts();

  return 0;
}
