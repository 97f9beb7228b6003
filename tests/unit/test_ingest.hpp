#pragma once

namespace txengine::tests {

void test_csv_split();
void test_csv_reader_records();
void test_csv_reader_column_order();
void test_csv_reader_errors();

}  // namespace txengine::tests
