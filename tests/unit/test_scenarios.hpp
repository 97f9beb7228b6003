#pragma once

namespace txengine::tests {

void test_scenario_deposits_one_client();
void test_scenario_withdrawals();
void test_scenario_disputes();
void test_scenario_chargebacks();
void test_scenario_multiple_clients();
void test_scenario_multiple_clients_sharded();
void test_scenario_invalid_record_aborts();
void test_scenario_balance_overflow_aborts();

}  // namespace txengine::tests
