// camring_capture.cpp
// Push synthetic FakeCamera frames into an HDF5 ring buffer and report the
// sustained frame rate. Optionally dump the ring to an XRAW archive at the end.
//
// Usage:  ./camring_capture [width height fps frames capacity directory export]
//   width/height default: 640 x 480
//   fps default: 0 (unpaced, measures store throughput)
//   frames default: 200
//   capacity default: 100
//   directory default: "."
//   export default: none (.xraw plain, .xlz4 compressed)
//
// Ctrl+C stops early; the ring buffer file is closed either way.

#include "camring/Errors.hpp"
#include "camring/Exporter.hpp"
#include "camring/FakeCamera.hpp"
#include "camring/FrameStore.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace std;
using namespace std::chrono;

static atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop = true; }

int main(int argc, char** argv)
{
    signal(SIGINT, on_sigint);

    // ---------- CLI ----------
    int width  = (argc > 1) ? atoi(argv[1]) : 640;
    int height = (argc > 2) ? atoi(argv[2]) : 480;
    int fps    = (argc > 3) ? atoi(argv[3]) : 0;
    uint64_t max_frames = (argc > 4) ? strtoull(argv[4], nullptr, 10) : 200;

    camring::FrameStoreConfig cfg;
    cfg.capacity  = (argc > 5) ? strtoull(argv[5], nullptr, 10) : 100;
    cfg.directory = (argc > 6) ? string(argv[6]) : string(".");
    string export_path = (argc > 7) ? string(argv[7]) : string();

    cout << "FakeCamera capture: " << width << "x" << height
         << " fps=" << fps << ", frames=" << max_frames
         << ", capacity=" << cfg.capacity << ", file=" << cfg.path() << "\n";

    try {
        camring::FakeCamera cam(width, height, fps);
        cam.open();
        cam.start();

        camring::FrameStore store(cfg);

        double sum_grab_ms = 0, sum_write_ms = 0;
        uint64_t frames = 0;

        while (!g_stop && frames < max_frames) {
            auto t0 = high_resolution_clock::now();
            cv::Mat frame = cam.acquire_frame(100);
            auto t1 = high_resolution_clock::now();
            store.write(frame, cam.roi());
            auto t2 = high_resolution_clock::now();

            const double grab_ms  = duration<double, milli>(t1 - t0).count();
            const double write_ms = duration<double, milli>(t2 - t1).count();
            sum_grab_ms  += grab_ms;
            sum_write_ms += write_ms;

            if ((frames % 100) == 0) {
                cout << "Frame " << frames << " -> slot " << (store.index() + cfg.capacity - 1) % cfg.capacity
                     << " grab:" << grab_ms << "ms"
                     << " write+flush:" << write_ms << "ms\n";
            }
            ++frames;
        }
        cam.stop();
        cam.close();

        if (frames > 0) {
            const double avg_g = sum_grab_ms / frames;
            const double avg_w = sum_write_ms / frames;
            const double tot   = avg_g + avg_w;
            cout << "\nFrames: " << frames << "  occupied slots: " << store.length()
                 << "  Averages -> grab " << avg_g << " ms, write " << avg_w
                 << " ms, total " << tot
                 << " ms  => " << (1000.0 / tot) << " FPS\n";
        }

        if (!export_path.empty()) {
            camring::Exporter(store).save_as(export_path);
            cout << "Exported to " << export_path << "\n";
        }

        store.close();
    } catch (const std::exception& e) {
        cerr << "camring_capture: " << e.what() << "\n";
        return 1;
    }

    cout << "done.\n";
    return 0;
}
