// All checks in tests/constexpr/*/test_*.cpp are static_asserts; compiling them is the test.
int main() {
    return 0;
}
