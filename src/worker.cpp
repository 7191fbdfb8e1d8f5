#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <stdexcept>

namespace sandbox {
using namespace std;

execution_pool::execution_pool(judge &j, size_t threads) : j(j) {
    if (threads == 0) threads = 1;
    for (size_t i = 0; i < threads; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
}

execution_pool::~execution_pool() {
    stop();
}

future<execution_result> execution_pool::submit(const execution_request &request) {
    execution_task task;
    task.request = request;
    future<execution_result> result = task.promise.get_future();
    if (!task_queue.push(move(task)))
        throw logic_error("execution pool has been stopped");
    return result;
}

void execution_pool::stop() {
    task_queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

size_t execution_pool::size() const {
    return workers.size();
}

void execution_pool::worker_loop(size_t worker_id) {
    DLOG(INFO) << "execution worker " << worker_id << " started";
    // 队列关闭且为空时 pop 返回空值，worker 退出
    while (auto task = task_queue.pop()) {
        try {
            task->promise.set_value(j.execute(task->request));
        } catch (exception &ex) {
            LOG(ERROR) << "execution worker " << worker_id << " failed: " << boost::diagnostic_information(ex);
            task->promise.set_exception(current_exception());
        }
    }
    DLOG(INFO) << "execution worker " << worker_id << " stopped";
}

}  // namespace sandbox
