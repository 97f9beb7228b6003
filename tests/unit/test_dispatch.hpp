#pragma once

namespace txengine::tests {

void test_dispatcher_preserves_client_order();
void test_dispatcher_rethrows_invalid_record();
void test_dispatcher_rethrows_source_error();
void test_dispatcher_rejects_bad_config();

}  // namespace txengine::tests
