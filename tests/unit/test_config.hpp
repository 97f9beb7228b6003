#pragma once

namespace txengine::tests {

void test_config_defaults();
void test_config_overrides();
void test_config_validation();
void test_config_load_file();

}  // namespace txengine::tests
