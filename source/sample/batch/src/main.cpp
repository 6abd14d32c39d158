#include "taskq/sample/batch/manager.hpp"

int main() noexcept
{
    using namespace taskq;
    try
    {
        logger::configure_from_environment();

        sample::batch::manager batch;
        return batch.run() ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        logger::log(logger::level::error, std::source_location::current(), "Fatal error: {}", e.what());
        return 1;
    }
}
