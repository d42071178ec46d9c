#include <cpptrace/from_current.hpp>
#include <cstdlib>
#include <iostream>

#include "Shell/CommandShell.hpp"

int main(int argc, const char** argv) {
    CPPTRACE_TRY {
        auto shell = loopy::CommandShell::create(static_cast<int32_t>(argc), argv);
        auto ret = shell->run();
        shell.reset();
        loopy::Logger::stopDefaultLogger();
        return ret;
    } CPPTRACE_CATCH(const std::exception& ex) {
        std::cerr << "Exception in loopy-shell: " << ex.what() << std::endl;
        cpptrace::from_current_exception().print();
        return EXIT_FAILURE;
    }
}
