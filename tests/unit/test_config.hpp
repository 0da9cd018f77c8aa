#pragma once

namespace wagerledger::tests {

void test_config_defaults();
void test_config_validation();

}  // namespace wagerledger::tests
